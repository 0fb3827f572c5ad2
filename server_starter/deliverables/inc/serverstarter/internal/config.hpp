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



#ifndef SST_CONFIG_HPP_INCLUDED
#define SST_CONFIG_HPP_INCLUDED

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace serverstarter {

namespace internal {

// coverity[autosar_cpp14_a0_1_1_violation:INTENTIONAL] These are constants that are used globally.
constexpr std::size_t kMaxOutputChunk = 4096U;  ///< Maximum number of bytes taken from a child output pipe per read

extern const std::string_view kDefaultInterpreter;  ///< Interpreter used when the descriptor leaves it empty
extern const std::string_view kServerStopCommand;   ///< Graceful shutdown command understood by game servers
extern const std::string_view kProxyStopCommand;    ///< Graceful shutdown command understood by proxies

extern const std::chrono::milliseconds
    kStopTimeout;  ///< The time stop() waits for a process to exit voluntarily before it is killed
extern const std::chrono::milliseconds kMaxSigKillDelay;  ///< The maximum time to wait for a process termination after SIGKILL
extern const std::chrono::milliseconds
    kOutputPollInterval;  ///< Granularity at which a blocked read of child output observes a stop request
extern const std::chrono::milliseconds
    kExitPollResolution;  ///< Sleep between two non-blocking checks for child process exit

}  // namespace internal

}  // namespace serverstarter

#endif  /// SST_CONFIG_HPP_INCLUDED
