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


#include <serverstarter/internal/config.hpp>

namespace serverstarter {

namespace internal {

constexpr std::string_view kDefaultInterpreter{"java"};  ///< Interpreter used when the descriptor leaves it empty
constexpr std::string_view kServerStopCommand{"stop\n"};  ///< Graceful shutdown command understood by game servers
constexpr std::string_view kProxyStopCommand{"end\n"};    ///< Graceful shutdown command understood by proxies

constexpr std::chrono::milliseconds kStopTimeout(10000);   ///< Voluntary exit window granted by stop()
constexpr std::chrono::milliseconds kMaxSigKillDelay(500);  ///< The maximum time to wait for a process termination

constexpr std::chrono::milliseconds kOutputPollInterval(
    100);  ///< Granularity at which a blocked read of child output observes a stop request
constexpr std::chrono::milliseconds kExitPollResolution(
    10);  ///< Sleep between two non-blocking checks for child process exit

}  // namespace internal

}  // namespace serverstarter
