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


#include <serverstarter/internal/supervisiontask.hpp>

namespace serverstarter {

namespace internal {

bool SupervisionTask::cancel() noexcept {
    return stop_source_.request_stop();
}

score::cpp::stop_token SupervisionTask::getToken() const noexcept {
    return stop_source_.get_token();
}

bool SupervisionTask::isCancelled() const noexcept {
    return stop_source_.stop_requested();
}

void SupervisionTask::markDone() noexcept {
    done_.store(true);
}

bool SupervisionTask::isDone() const noexcept {
    return done_.load();
}

}  // namespace internal

}  // namespace serverstarter
