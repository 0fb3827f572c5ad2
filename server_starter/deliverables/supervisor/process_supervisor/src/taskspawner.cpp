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


#include <serverstarter/internal/log.hpp>
#include <serverstarter/internal/taskspawner.hpp>

#include <exception>
#include <utility>

namespace serverstarter {

namespace internal {

TaskSpawner::~TaskSpawner() {
    shutdown();
}

bool TaskSpawner::spawn(std::shared_ptr<SupervisionTask> task, Work work) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (is_shut_down_) {
        SST_LOG_WARN() << "Task spawner is shut down, task rejected";
        return false;
    }

    reapFinished();

    try {
        score::cpp::jthread thread{[task, work = std::move(work)]() {
            work(task->getToken());
            task->markDone();
        }};
        workers_.push_back(Worker{std::move(task), std::move(thread)});
    } catch (const std::exception& error) {
        SST_LOG_ERROR() << "Unable to create worker thread:" << error.what();
        return false;
    }

    return true;
}

void TaskSpawner::shutdown() {
    std::list<Worker> workers;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        is_shut_down_ = true;
        workers.swap(workers_);
    }

    for (auto& worker : workers) {
        static_cast<void>(worker.task_->cancel());
    }

    for (auto& worker : workers) {
        if (worker.thread_.joinable()) {
            worker.thread_.join();
        }
    }
}

std::size_t TaskSpawner::workerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void TaskSpawner::reapFinished() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->task_->isDone()) {
            if (it->thread_.joinable()) {
                it->thread_.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace internal

}  // namespace serverstarter
