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

#ifndef SUPERVISOR_TEST_HELPER_HPP_INCLUDED
#define SUPERVISOR_TEST_HELPER_HPP_INCLUDED

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <serverstarter/internal/osal/iprocess.hpp>
#include <serverstarter/lifecycle_observer.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace serverstarter {

namespace test {

using internal::osal::IChildProcess;
using internal::osal::IProcess;
using internal::osal::OsalConfig;
using internal::osal::OsalReturnType;
using internal::osal::ProcessID;

/// @brief Polls predicate until it holds or timeout expires.
/// @return AssertionSuccess if predicate held in time.
inline testing::AssertionResult waitUntil(const std::function<bool()>& predicate,
                                          std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return testing::AssertionFailure() << "condition not met within " << timeout.count() << " ms";
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    return testing::AssertionSuccess();
}

/// @brief Scripted child process. Output lines are pushed by the test, input is recorded.
class FakeChildProcess final : public IChildProcess {
   public:
    explicit FakeChildProcess(ProcessID pid = 4242) : pid_(pid) {
    }

    /// @brief Queues one line of output.
    void pushOutput(std::string line) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_.push_back(std::move(line));
        cv_.notify_all();
    }

    /// @brief Terminates the fake process, its output stream closes after the queued lines.
    void exit(std::int32_t status = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        exitLocked(status);
    }

    /// @brief Every following write fails, as if the child closed its input.
    void setFailWrites(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    /// @brief The process exits as soon as input containing trigger is written.
    void setExitOnInput(std::string trigger) {
        std::lock_guard<std::mutex> lock(mutex_);
        exit_trigger_ = std::move(trigger);
    }

    /// @brief Calls to writeInput block for the given time before recording data.
    void setWriteDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_delay_ = delay;
    }

    /// @brief SIGKILL is not honoured, the process keeps running.
    void setIgnoreKill(bool ignore) {
        std::lock_guard<std::mutex> lock(mutex_);
        ignore_kill_ = ignore;
    }

    std::string writtenInput() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    int killCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return kill_count_;
    }

    int concurrentWriters() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_concurrent_writers_;
    }

    /// @brief Number of pushed output lines not read yet.
    std::size_t pendingOutput() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return output_.size();
    }

    ProcessID getPid() const noexcept override {
        return pid_;
    }

    OsalReturnType readLine(std::string& line, const score::cpp::stop_token& token) override {
        std::unique_lock<std::mutex> lock(mutex_);

        while (true) {
            if (!output_.empty()) {
                line = std::move(output_.front());
                output_.pop_front();
                return OsalReturnType::kSuccess;
            }
            if (exited_) {
                return OsalReturnType::kFail;
            }
            if (token.stop_requested()) {
                return OsalReturnType::kCancelled;
            }
            cv_.wait_for(lock, std::chrono::milliseconds(5));
        }
    }

    OsalReturnType writeInput(std::string_view data) override {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fail_writes_ || exited_) {
                return OsalReturnType::kFail;
            }
            delay = write_delay_;
            ++active_writers_;
            if (active_writers_ > max_concurrent_writers_) {
                max_concurrent_writers_ = active_writers_;
            }
        }

        std::this_thread::sleep_for(delay);

        std::lock_guard<std::mutex> lock(mutex_);
        --active_writers_;
        written_.append(data.data(), data.size());
        writes_.emplace_back(data);

        if (!exit_trigger_.empty() && written_.find(exit_trigger_) != std::string::npos) {
            exitLocked(0);
        }

        return OsalReturnType::kSuccess;
    }

    bool isAlive() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !exited_;
    }

    OsalReturnType waitForExit(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return exited_; }) ? OsalReturnType::kSuccess
                                                                         : OsalReturnType::kTimeout;
    }

    OsalReturnType waitForExit(const score::cpp::stop_token& token) override {
        std::unique_lock<std::mutex> lock(mutex_);

        while (!exited_) {
            if (token.stop_requested()) {
                return OsalReturnType::kCancelled;
            }
            cv_.wait_for(lock, std::chrono::milliseconds(5));
        }

        return OsalReturnType::kSuccess;
    }

    OsalReturnType forceTermination() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++kill_count_;
        if (!ignore_kill_) {
            exitLocked(9);
        }
        return OsalReturnType::kSuccess;
    }

    std::int32_t exitStatus() const noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        return exited_ ? status_ : -1;
    }

   private:
    void exitLocked(std::int32_t status) {
        if (!exited_) {
            exited_ = true;
            status_ = status;
        }
        cv_.notify_all();
    }

    const ProcessID pid_;
    mutable std::mutex mutex_{};
    std::condition_variable cv_{};
    std::deque<std::string> output_{};
    bool exited_{false};
    std::int32_t status_{-1};
    bool fail_writes_{false};
    bool ignore_kill_{false};
    std::string exit_trigger_{};
    std::chrono::milliseconds write_delay_{0};
    std::string written_{};
    std::vector<std::string> writes_{};
    int kill_count_{0};
    int active_writers_{0};
    int max_concurrent_writers_{0};
};

class MockProcessInterface : public IProcess {
   public:
    MOCK_METHOD(OsalReturnType, startProcess, (std::shared_ptr<IChildProcess>& child, const OsalConfig& config),
                (override));
};

class MockLifecycleObserver : public ILifecycleObserver {
   public:
    MOCK_METHOD(void, onLifecycleEvent, (const ServerId& id, LifecycleEvent event, std::string_view detail),
                (noexcept, override));
};

/// @brief Observer that records every event, for assertions on the sequence of transitions.
class RecordingObserver final : public ILifecycleObserver {
   public:
    void onLifecycleEvent(const ServerId& id, LifecycleEvent event, std::string_view detail) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(Record{id, event, std::string{detail}});
    }

    int count(const ServerId& id, LifecycleEvent event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int result = 0;
        for (const auto& record : events_) {
            if (record.id_ == id && record.event_ == event) {
                ++result;
            }
        }
        return result;
    }

    std::vector<LifecycleEvent> events(const ServerId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LifecycleEvent> result;
        for (const auto& record : events_) {
            if (record.id_ == id) {
                result.push_back(record.event_);
            }
        }
        return result;
    }

   private:
    struct Record {
        ServerId id_;
        LifecycleEvent event_;
        std::string detail_;
    };

    mutable std::mutex mutex_{};
    std::vector<Record> events_{};
};

}  // namespace test

}  // namespace serverstarter

#endif  // SUPERVISOR_TEST_HELPER_HPP_INCLUDED
