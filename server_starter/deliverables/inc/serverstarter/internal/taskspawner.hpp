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



#ifndef SST_TASK_SPAWNER_HPP_INCLUDED
#define SST_TASK_SPAWNER_HPP_INCLUDED

#include <serverstarter/internal/supervisiontask.hpp>
#include <score/jthread.hpp>
#include <score/stop_token.hpp>

#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>

namespace serverstarter {

namespace internal {

/// @brief Dynamically sized pool of worker threads, one per supervising task.
/// The pool grows with every spawned task. Workers whose task body returned are joined lazily, on the next spawn
/// or on shutdown. The spawner is owned by the supervisor and drained when the supervisor is destroyed.
class TaskSpawner final {
   public:
    /// @brief The work executed by one task. It receives the stop token of its task handle.
    using Work = std::function<void(const score::cpp::stop_token&)>;

    TaskSpawner() = default;

    /// @brief Destructor.
    /// Requests every task to stop and joins all worker threads.
    ~TaskSpawner();

    // Rule of five
    /// @brief Copy constructor is deleted to prevent copying.
    TaskSpawner(const TaskSpawner&) = delete;

    /// @brief Copy assignment operator is deleted to prevent copying.
    TaskSpawner& operator=(const TaskSpawner&) = delete;

    /// @brief Move constructor is deleted to prevent moving.
    TaskSpawner(TaskSpawner&&) = delete;

    /// @brief Move assignment operator is deleted to prevent moving.
    TaskSpawner& operator=(TaskSpawner&&) = delete;

    /// @brief Runs work on a new worker thread.
    /// @param task  Handle of the task. Its token is passed to work, it is marked done when work returns.
    /// @param work  The task body.
    /// @return false if the spawner is shut down or no thread could be created. work is not executed then.
    bool spawn(std::shared_ptr<SupervisionTask> task, Work work);

    /// @brief Requests every task to stop and joins all worker threads. Further spawns are rejected.
    void shutdown();

    /// @brief Returns the number of workers that were not joined yet, finished ones included.
    std::size_t workerCount() const;

   private:
    struct Worker {
        std::shared_ptr<SupervisionTask> task_;
        score::cpp::jthread thread_;
    };

    /// @brief Joins and removes workers whose task body returned. Caller must hold mutex_.
    void reapFinished();

    mutable std::mutex mutex_{};
    std::list<Worker> workers_{};
    bool is_shut_down_{false};
};

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_TASK_SPAWNER_HPP_INCLUDED
