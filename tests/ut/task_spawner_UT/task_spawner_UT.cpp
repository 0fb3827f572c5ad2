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
#include <serverstarter/internal/taskspawner.hpp>
#include <supervisor_test_helper.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace testing;

using serverstarter::internal::SupervisionTask;
using serverstarter::internal::TaskSpawner;
using serverstarter::test::waitUntil;

class TaskSpawnerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        RecordProperty("TestType", "interface-test");
        RecordProperty("DerivationTechnique", "explorative-testing ");
    }

    TaskSpawner spawner_{};
};

TEST_F(TaskSpawnerTest, TaskRunsAndIsMarkedDone)
{
    RecordProperty("Description", "This test verifies that a spawned task runs and its handle is marked done.");
    auto task = std::make_shared<SupervisionTask>();
    std::atomic_bool ran{false};

    ASSERT_TRUE(spawner_.spawn(task, [&ran](const score::cpp::stop_token&) { ran = true; }));
    ASSERT_TRUE(waitUntil([&task]() { return task->isDone(); }));
    EXPECT_TRUE(ran.load());
    EXPECT_FALSE(task->isCancelled());
}

TEST_F(TaskSpawnerTest, CancelReachesTaskToken)
{
    RecordProperty("Description",
                   "This test verifies that cancelling a task handle is observed through the token passed to the "
                   "task body, and that a second cancel reports that a stop was requested before.");
    auto task = std::make_shared<SupervisionTask>();
    std::atomic_bool observed{false};

    ASSERT_TRUE(spawner_.spawn(task, [&observed](const score::cpp::stop_token& token) {
        while (!token.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        observed = true;
    }));

    EXPECT_TRUE(task->cancel());
    EXPECT_FALSE(task->cancel());
    ASSERT_TRUE(waitUntil([&task]() { return task->isDone(); }));
    EXPECT_TRUE(observed.load());
}

TEST_F(TaskSpawnerTest, FinishedWorkersAreReapedOnNextSpawn)
{
    RecordProperty("Description",
                   "This test verifies that the pool grows per task and finished workers are joined on the next "
                   "spawn.");
    auto first = std::make_shared<SupervisionTask>();
    ASSERT_TRUE(spawner_.spawn(first, [](const score::cpp::stop_token&) {}));
    ASSERT_TRUE(waitUntil([&first]() { return first->isDone(); }));
    EXPECT_EQ(spawner_.workerCount(), 1U);

    auto second = std::make_shared<SupervisionTask>();
    ASSERT_TRUE(spawner_.spawn(second, [](const score::cpp::stop_token& token) {
        while (!token.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }));
    EXPECT_EQ(spawner_.workerCount(), 1U);

    spawner_.shutdown();
    EXPECT_TRUE(second->isDone());
}

TEST_F(TaskSpawnerTest, ShutdownCancelsJoinsAndRejects)
{
    RecordProperty("Description",
                   "This test verifies that shutdown() requests every task to stop, joins all workers and rejects "
                   "further tasks.");
    constexpr int kTasks = 8;
    std::vector<std::shared_ptr<SupervisionTask>> tasks;

    for (int i = 0; i < kTasks; ++i) {
        tasks.push_back(std::make_shared<SupervisionTask>());
        ASSERT_TRUE(spawner_.spawn(tasks.back(), [](const score::cpp::stop_token& token) {
            while (!token.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }));
    }

    spawner_.shutdown();

    for (const auto& task : tasks) {
        EXPECT_TRUE(task->isCancelled());
        EXPECT_TRUE(task->isDone());
    }
    EXPECT_EQ(spawner_.workerCount(), 0U);

    std::atomic_bool ran{false};
    EXPECT_FALSE(spawner_.spawn(std::make_shared<SupervisionTask>(),
                                [&ran](const score::cpp::stop_token&) { ran = true; }));
    EXPECT_FALSE(ran.load());
}
