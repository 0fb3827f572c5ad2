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



#ifndef SUPERVISOR_SETTINGS_HPP_INCLUDED
#define SUPERVISOR_SETTINGS_HPP_INCLUDED

#include <chrono>

namespace serverstarter {

/// @brief Per supervisor tuning knobs.
/// Default constructed settings use the production values from serverstarter/internal/config.hpp.
struct SupervisorSettings {
    /// @brief Creates settings with the production defaults.
    SupervisorSettings();

    std::chrono::milliseconds stop_timeout_;         ///< How long stop() waits for a voluntary exit before the kill
    std::chrono::milliseconds output_poll_interval_; ///< How often a blocked output read checks for cancellation
};

}  // namespace serverstarter

#endif  // SUPERVISOR_SETTINGS_HPP_INCLUDED
