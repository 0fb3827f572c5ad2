/********************************************************************************
 * Copyright (c) 2025 Contributors to the Eclipse Foundation
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



#ifndef SST_SUPERVISION_TASK_HPP_INCLUDED
#define SST_SUPERVISION_TASK_HPP_INCLUDED

#include <score/stop_token.hpp>

#include <atomic>

namespace serverstarter {

namespace internal {

/// @brief Handle of the asynchronous task that supervises one server process.
/// Cancellation is cooperative: cancel() only requests a stop, the task observes the request at its blocking
/// points (reading output, waiting for exit). Cancelling never terminates the OS process.
class SupervisionTask final {
   public:
    SupervisionTask() = default;
    ~SupervisionTask() = default;

    // Rule of five
    /// @brief Copy constructor is deleted, the task handle is shared through a pointer.
    SupervisionTask(const SupervisionTask&) = delete;

    /// @brief Copy assignment operator is deleted, the task handle is shared through a pointer.
    SupervisionTask& operator=(const SupervisionTask&) = delete;

    /// @brief Move constructor is deleted to prevent moving.
    SupervisionTask(SupervisionTask&&) = delete;

    /// @brief Move assignment operator is deleted to prevent moving.
    SupervisionTask& operator=(SupervisionTask&&) = delete;

    /// @brief Requests the task to stop at its next blocking point.
    /// @return true if this call made the request, false if a stop was requested before.
    bool cancel() noexcept;

    /// @brief Returns the token the task observes.
    score::cpp::stop_token getToken() const noexcept;

    bool isCancelled() const noexcept;

    /// @brief Called by the worker thread once the task body returned.
    void markDone() noexcept;

    /// @brief Returns true once the task body returned, the worker thread can then be joined without blocking.
    bool isDone() const noexcept;

   private:
    score::cpp::stop_source stop_source_{};
    std::atomic_bool done_{false};
};

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_SUPERVISION_TASK_HPP_INCLUDED
