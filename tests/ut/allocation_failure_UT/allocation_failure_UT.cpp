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
#include <serverstarter/lifecycle_observer.hpp>
#include <serverstarter/process_supervisor.hpp>
#include <supervisor_test_helper.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <new>
#include <string>

using serverstarter::ILifecycleObserver;
using serverstarter::LifecycleEvent;
using serverstarter::ProcessSupervisor;
using serverstarter::ServerDescriptor;
using serverstarter::ServerId;
using serverstarter::ServerState;
using serverstarter::SupervisorSettings;
using serverstarter::test::waitUntil;

namespace {

// Index of the next allocation of this thread that fails, -1 when disarmed. Fires once.
thread_local int g_failing_allocation = -1;

}  // namespace

void* operator new(std::size_t size) {
    if (g_failing_allocation >= 0 && g_failing_allocation-- == 0) {
        throw std::bad_alloc();
    }

    if (void* memory = std::malloc(size == 0U ? 1U : size)) {
        return memory;
    }

    throw std::bad_alloc();
}

void operator delete(void* memory) noexcept {
    std::free(memory);
}

void operator delete(void* memory, std::size_t) noexcept {
    std::free(memory);
}

namespace {

/// @brief Observer that does not allocate, so it can be notified while allocations fail.
class CountingObserver final : public ILifecycleObserver {
   public:
    void onLifecycleEvent(const ServerId&, LifecycleEvent event, std::string_view) noexcept override {
        if (event == LifecycleEvent::kStartFailed) {
            ++start_failed_;
        }
    }

    std::atomic<int> start_failed_{0};
};

}  // namespace

class AllocationFailureTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        RecordProperty("TestType", "interface-test");
        RecordProperty("DerivationTechnique", "explorative-testing ");

        descriptor_.name_ = "lobby";
        descriptor_.interpreter_path_ = "/nonexistent/server-starter/java";
        descriptor_.min_memory_mb_ = 512U;
        descriptor_.max_memory_mb_ = 1024U;
        descriptor_.server_software_path_ = "paper.jar";
        descriptor_.port_ = 25565U;

        settings_.output_poll_interval_ = std::chrono::milliseconds(10);
    }

    /// @brief Fails the allocation with the given index on this thread during call, returns true if it fired.
    template <typename Call>
    static bool failAllocation(int index, Call&& call)
    {
        g_failing_allocation = index;
        call();
        const bool fired = (g_failing_allocation < 0);
        g_failing_allocation = -1;
        return fired;
    }

    ServerDescriptor descriptor_{};
    SupervisorSettings settings_{};
    std::shared_ptr<CountingObserver> observer_{std::make_shared<CountingObserver>()};
};

TEST_F(AllocationFailureTest, StartLeavesNoStateBehind)
{
    RecordProperty("Description",
                   "This test verifies that an allocation failure at any point of start() neither terminates the "
                   "program nor leaves a registry entry behind.");
    ProcessSupervisor supervisor{observer_, settings_};
    const ServerId id{"alloc"};
    int failures = 0;
    bool completed = false;

    for (int index = 0; index < 1000 && !completed; ++index) {
        const bool fired = failAllocation(index, [&supervisor, &id, this]() { supervisor.start(id, descriptor_); });
        completed = !fired;
        failures += fired ? 1 : 0;

        ASSERT_TRUE(waitUntil([&supervisor]() { return supervisor.getServerIds().empty(); })) << "index " << index;
        EXPECT_EQ(supervisor.getState(id), ServerState::kAbsent);
    }

    EXPECT_TRUE(completed);
    EXPECT_GT(failures, 0);
    EXPECT_GT(observer_->start_failed_.load(), 0);
}

TEST_F(AllocationFailureTest, QueriesReportFailureInsteadOfTerminating)
{
    RecordProperty("Description",
                   "This test verifies that showLogs() and getLogs() return an error value when an allocation "
                   "fails inside them.");
    ProcessSupervisor supervisor{observer_, settings_};
    const ServerId id{"unknown"};
    const std::string expected = "No logs available for server: unknown";
    bool completed = false;

    for (int index = 0; index < 1000 && !completed; ++index) {
        std::string logs;
        const bool fired = failAllocation(index, [&supervisor, &id, &logs]() { logs = supervisor.showLogs(id); });
        completed = !fired;

        if (fired) {
            EXPECT_TRUE(logs.empty() || logs == expected) << "index " << index;
        } else {
            EXPECT_EQ(logs, expected);
        }
    }
    EXPECT_TRUE(completed);

    bool has_value = true;
    static_cast<void>(failAllocation(0, [&supervisor, &id, &has_value]() {
        has_value = supervisor.getLogs(id).has_value();
    }));
    EXPECT_FALSE(has_value);
}
