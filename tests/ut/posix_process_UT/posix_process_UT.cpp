/********************************************************************************
 * Copyright (c) 2026 Contributors to the Eclipse Foundation
 *
 * See the NOTICE file(s) distributed with this work for additional
 * information regarding copyright ownership.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Apache License Version 2.0 which is available at
 * https://www.apache.org/licenses/LICENSE-2.0
 *
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************************/

#include <gtest/gtest.h>
#include <serverstarter/internal/osal/posixprocess.hpp>
#include <sys/wait.h>

#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

using namespace testing;

using serverstarter::internal::osal::IChildProcess;
using serverstarter::internal::osal::OsalConfig;
using serverstarter::internal::osal::OsalReturnType;
using serverstarter::internal::osal::PosixProcess;

class PosixProcessTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        RecordProperty("TestType", "interface-test");
        RecordProperty("DerivationTechnique", "explorative-testing ");
    }

    void TearDown() override
    {
        if (child_ && child_->isAlive()) {
            static_cast<void>(child_->forceTermination());
            static_cast<void>(child_->waitForExit(std::chrono::milliseconds(1000)));
        }
    }

    OsalReturnType start(std::vector<std::string> argv)
    {
        OsalConfig config;
        config.short_name_ = "test";
        config.argv_ = std::move(argv);
        config.output_poll_interval_ = std::chrono::milliseconds(10);
        return process_.startProcess(child_, config);
    }

    PosixProcess process_{};
    std::shared_ptr<IChildProcess> child_{};
    score::cpp::stop_source stop_source_{};
};

TEST_F(PosixProcessTest, OutputIsReadLineByLine)
{
    RecordProperty("Description",
                   "This test verifies that the output of a child is delivered line by line, with carriage returns "
                   "removed and a final unterminated line delivered when the stream closes.");
    ASSERT_EQ(start({"/bin/sh", "-c", "echo hello; printf 'world\\r\\n'; printf 'tail'"}), OsalReturnType::kSuccess);
    ASSERT_NE(child_, nullptr);
    EXPECT_GT(child_->getPid(), 0);

    std::string line;
    ASSERT_EQ(child_->readLine(line, stop_source_.get_token()), OsalReturnType::kSuccess);
    EXPECT_EQ(line, "hello");
    ASSERT_EQ(child_->readLine(line, stop_source_.get_token()), OsalReturnType::kSuccess);
    EXPECT_EQ(line, "world");
    ASSERT_EQ(child_->readLine(line, stop_source_.get_token()), OsalReturnType::kSuccess);
    EXPECT_EQ(line, "tail");
    EXPECT_EQ(child_->readLine(line, stop_source_.get_token()), OsalReturnType::kFail);

    ASSERT_EQ(child_->waitForExit(stop_source_.get_token()), OsalReturnType::kSuccess);
    EXPECT_FALSE(child_->isAlive());
    const auto status = child_->exitStatus();
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST_F(PosixProcessTest, InputReachesChild)
{
    RecordProperty("Description",
                   "This test verifies that bytes written to the child input are received by the child.");
    ASSERT_EQ(start({"/bin/cat"}), OsalReturnType::kSuccess);

    ASSERT_EQ(child_->writeInput("say hi\n"), OsalReturnType::kSuccess);
    std::string line;
    ASSERT_EQ(child_->readLine(line, stop_source_.get_token()), OsalReturnType::kSuccess);
    EXPECT_EQ(line, "say hi");
    EXPECT_TRUE(child_->isAlive());
}

TEST_F(PosixProcessTest, GracefulExitOnStopCommand)
{
    RecordProperty("Description",
                   "This test verifies that a child reading a stop command from its input exits within the timeout.");
    ASSERT_EQ(start({"/bin/sh", "-c", "while read l; do [ \"$l\" = stop ] && exit 3; done"}),
              OsalReturnType::kSuccess);

    ASSERT_EQ(child_->writeInput("stop\n\n"), OsalReturnType::kSuccess);
    ASSERT_EQ(child_->waitForExit(std::chrono::milliseconds(5000)), OsalReturnType::kSuccess);
    ASSERT_TRUE(WIFEXITED(child_->exitStatus()));
    EXPECT_EQ(WEXITSTATUS(child_->exitStatus()), 3);
}

TEST_F(PosixProcessTest, WaitTimesOutAndKillTerminates)
{
    RecordProperty("Description",
                   "This test verifies that waiting on a running child times out, and that forced termination "
                   "kills it with SIGKILL.");
    ASSERT_EQ(start({"/bin/sleep", "30"}), OsalReturnType::kSuccess);

    EXPECT_EQ(child_->waitForExit(std::chrono::milliseconds(50)), OsalReturnType::kTimeout);
    EXPECT_TRUE(child_->isAlive());

    ASSERT_EQ(child_->forceTermination(), OsalReturnType::kSuccess);
    ASSERT_EQ(child_->waitForExit(std::chrono::milliseconds(1000)), OsalReturnType::kSuccess);
    ASSERT_TRUE(WIFSIGNALED(child_->exitStatus()));
    EXPECT_EQ(WTERMSIG(child_->exitStatus()), SIGKILL);

    // a reaped child is never signalled again
    EXPECT_EQ(child_->forceTermination(), OsalReturnType::kSuccess);
}

TEST_F(PosixProcessTest, BlockingReadAndWaitObserveStopRequest)
{
    RecordProperty("Description",
                   "This test verifies that a blocked readLine() and waitForExit() return kCancelled after a stop "
                   "request, without terminating the child.");
    ASSERT_EQ(start({"/bin/sleep", "30"}), OsalReturnType::kSuccess);

    std::thread canceller([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop_source_.request_stop();
    });

    std::string line;
    EXPECT_EQ(child_->readLine(line, stop_source_.get_token()), OsalReturnType::kCancelled);
    canceller.join();
    EXPECT_EQ(child_->waitForExit(stop_source_.get_token()), OsalReturnType::kCancelled);
    EXPECT_TRUE(child_->isAlive());
}

TEST_F(PosixProcessTest, WriteAfterExitFails)
{
    RecordProperty("Description",
                   "This test verifies that writing to a child that exited reports a failure instead of raising "
                   "SIGPIPE.");
    ASSERT_EQ(start({"/bin/true"}), OsalReturnType::kSuccess);
    ASSERT_EQ(child_->waitForExit(std::chrono::milliseconds(5000)), OsalReturnType::kSuccess);

    EXPECT_EQ(child_->writeInput("stop\n\n"), OsalReturnType::kFail);
}

TEST_F(PosixProcessTest, MissingExecutableIsASpawnFailure)
{
    RecordProperty("Description",
                   "This test verifies that an executable that cannot be executed is reported by startProcess().");
    EXPECT_EQ(start({"/nonexistent/server-starter/java", "-jar", "paper.jar"}), OsalReturnType::kFail);
    EXPECT_EQ(child_, nullptr);

    EXPECT_EQ(start({}), OsalReturnType::kFail);
    EXPECT_EQ(child_, nullptr);
}
