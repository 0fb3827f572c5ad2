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



#ifndef LIFECYCLE_OBSERVER_HPP_INCLUDED
#define LIFECYCLE_OBSERVER_HPP_INCLUDED

#include <serverstarter/server_id.hpp>

#include <cstdint>
#include <string_view>

namespace serverstarter {

/// @brief Transitions of a supervised server that are reported to the observer.
enum class LifecycleEvent : std::uint8_t {
    kStartRequested = 0,         ///< start() was accepted, buffer and task are registered
    kStartIgnored = 1,           ///< start() was a no-op because the id is already registered
    kProcessStarted = 2,         ///< The OS process was spawned and registered
    kStartFailed = 3,            ///< The OS process could not be spawned
    kTaskCancelled = 4,          ///< The supervising task observed a stop request
    kProcessExited = 5,          ///< The OS process exited, detail carries the exit status
    kNoActiveProcess = 6,        ///< stop() or execute() found no live process
    kStopCommandSent = 7,        ///< The graceful shutdown command was written
    kStopCommandFailed = 8,      ///< Writing the graceful shutdown command failed
    kTerminatedGracefully = 9,   ///< The process exited within the stop timeout
    kForcedTermination = 10,     ///< The process was killed after the stop timeout
    kCommandSent = 11,           ///< execute() delivered a command
    kCommandFailed = 12,         ///< execute() could not deliver a command
    kCleanupRefused = 13,        ///< Cleanup was requested while the process is alive
    kCleanedUp = 14              ///< All registry state of the id was removed
};

/// @brief Returns a printable name of the event.
std::string_view toString(LifecycleEvent event) noexcept;

/// @brief Interface notified about every lifecycle transition of every supervised server.
/// Implementations are called from the caller threads of the supervisor API and from supervising
/// tasks at the same time, so they must be thread-safe.
class ILifecycleObserver {
   public:
    virtual ~ILifecycleObserver() = default;

    /// @brief Called on each lifecycle transition.
    /// @param id        The server the event belongs to.
    /// @param event     The transition that happened.
    /// @param detail    Additional human readable information, may be empty.
    virtual void onLifecycleEvent(const ServerId& id, LifecycleEvent event, std::string_view detail) noexcept = 0;
};

/// @brief Default observer, writes every transition to the server starter log.
class LoggingLifecycleObserver final : public ILifecycleObserver {
   public:
    void onLifecycleEvent(const ServerId& id, LifecycleEvent event, std::string_view detail) noexcept override;
};

}  // namespace serverstarter

#endif  // LIFECYCLE_OBSERVER_HPP_INCLUDED
