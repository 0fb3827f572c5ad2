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


#include <serverstarter/internal/logbuffer.hpp>

namespace serverstarter {

namespace internal {

void LogBuffer::append(std::string line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
}

std::vector<std::string> LogBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

std::string LogBuffer::toString() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string text;

    for (const auto& line : lines_) {
        text.append(line);
        text.push_back('\n');
    }

    return text;
}

std::size_t LogBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

}  // namespace internal

}  // namespace serverstarter
