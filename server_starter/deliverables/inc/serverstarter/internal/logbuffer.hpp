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



#ifndef SST_LOG_BUFFER_HPP_INCLUDED
#define SST_LOG_BUFFER_HPP_INCLUDED

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace serverstarter {

namespace internal {

/// @brief Append-only, ordered sequence of captured output lines of one server.
/// There is one appender (the log pump) and any number of readers. A reader never observes a partially written line.
class LogBuffer final {
   public:
    LogBuffer() = default;
    ~LogBuffer() = default;

    // Rule of five
    /// @brief Copy constructor is deleted, the buffer is shared through a pointer.
    LogBuffer(const LogBuffer&) = delete;

    /// @brief Copy assignment operator is deleted, the buffer is shared through a pointer.
    LogBuffer& operator=(const LogBuffer&) = delete;

    /// @brief Move constructor is deleted to prevent moving.
    LogBuffer(LogBuffer&&) = delete;

    /// @brief Move assignment operator is deleted to prevent moving.
    LogBuffer& operator=(LogBuffer&&) = delete;

    /// @brief Appends one complete line.
    void append(std::string line);

    /// @brief Returns a copy of all lines captured so far, in arrival order.
    std::vector<std::string> snapshot() const;

    /// @brief Returns all lines captured so far, each one terminated by "\n".
    std::string toString() const;

    std::size_t size() const;

   private:
    mutable std::mutex mutex_{};
    std::vector<std::string> lines_{};
};

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_LOG_BUFFER_HPP_INCLUDED
