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



#ifndef SERVER_STATE_HPP_INCLUDED
#define SERVER_STATE_HPP_INCLUDED

#include <cstdint>

namespace serverstarter {

/// @brief Supervision state of one server id.
enum class ServerState : std::uint8_t {
    kAbsent = 0,    ///< Nothing is registered for the id
    kStarting = 1,  ///< start() was accepted, the process is not published yet
    kRunning = 2,   ///< The process is published and alive
    kExiting = 3    ///< The process terminated, cleanup is pending
};

}  // namespace serverstarter

#endif  // SERVER_STATE_HPP_INCLUDED
