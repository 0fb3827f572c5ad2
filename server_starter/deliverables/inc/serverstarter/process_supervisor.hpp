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


#ifndef SERVERSTARTER_PROCESS_SUPERVISOR_HPP_INCLUDED
#define SERVERSTARTER_PROCESS_SUPERVISOR_HPP_INCLUDED

#include <serverstarter/lifecycle_observer.hpp>
#include <serverstarter/server_descriptor.hpp>
#include <serverstarter/server_id.hpp>
#include <serverstarter/server_state.hpp>
#include <serverstarter/supervisor_error_domain.h>
#include <serverstarter/supervisor_settings.hpp>
#include "score/result/result.h"

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace serverstarter {

namespace internal {
class ProcessSupervisorImpl;
}  // namespace internal

/// @brief Supervises the child processes of game and proxy servers.
/// @note The supervisor owns the complete lifecycle of each child: spawning with a deterministic command line,
/// capturing its standard output, injecting commands into its standard input and terminating it, either gracefully
/// (stop command followed by a bounded wait) or forcibly. Every server is identified by a ServerId.
///
class ProcessSupervisor final {
   public:
    /// @brief Creates a supervisor that spawns Posix processes and logs lifecycle events.
    ProcessSupervisor() noexcept;

    /// @brief Creates a supervisor with an injected lifecycle observer.
    ///
    /// @param[in] observer   notified about every lifecycle transition, nullptr selects the logging observer
    /// @param[in] settings   timeouts and polling intervals
    ///
    explicit ProcessSupervisor(std::shared_ptr<ILifecycleObserver> observer,
                               SupervisorSettings settings = SupervisorSettings{}) noexcept;

    /// @brief Stops every supervised server, then joins all supervising tasks.
    ~ProcessSupervisor() noexcept;

    // Applying the rule of five
    // Class will not be copyable, but it will be movable

    /// @brief Suppress default copy construction for ProcessSupervisor.
    ProcessSupervisor(const ProcessSupervisor&) = delete;

    /// @brief Suppress default copy assignment for ProcessSupervisor.
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /// @brief Intentional use of default move constructor for ProcessSupervisor.
    ///
    /// @param[in] rval reference to move
    ProcessSupervisor(ProcessSupervisor&& rval) noexcept;

    /// @brief Intentional use of default move assignment for ProcessSupervisor.
    ///
    /// @param[in] rval reference to move
    /// @returns the new reference
    ProcessSupervisor& operator=(ProcessSupervisor&& rval) noexcept;

    /// @brief Starts a server asynchronously.
    ///
    /// Does nothing if id is already registered. Otherwise an empty log buffer is registered and a supervising task
    /// spawns the process, captures its output and cleans up after it exits. Spawn failures are reported to the
    /// observer only. This method never blocks on the task.
    ///
    /// @param[in] id          identifier of the server
    /// @param[in] descriptor  launch configuration, copied
    ///
    /// @threadsafety{thread-safe}
    ///
    void start(const ServerId& id, const ServerDescriptor& descriptor) noexcept;

    /// @brief Stops a server, gracefully if possible.
    ///
    /// Cancels the supervising task, writes "stop" (or "end" for proxies) to the process, waits for the exit up to the
    /// stop timeout and kills the process afterwards. Write failures are logged and swallowed. Registry state of the
    /// server is cleaned up at the end in every case.
    ///
    /// @param[in] id   identifier of the server
    ///
    /// @threadsafety{thread-safe}
    ///
    void stop(const ServerId& id) noexcept;

    /// @brief Calls stop() for every registered server.
    void stopAll() noexcept;

    /// @brief Writes a command line to the standard input of a running server.
    ///
    /// @param[in] id        identifier of the server
    /// @param[in] command   command text, a newline is appended
    /// @returns void if the command was written or no live process exists, otherwise SupervisorErrorDomain error.
    /// @error serverstarter::SupervisorErrc::kCommandFailed if writing to the live process failed
    ///
    /// @threadsafety{thread-safe}
    ///
    score::Result<std::monostate> execute(const ServerId& id, std::string_view command) noexcept;

    /// @brief Returns the captured output of a server in printable form.
    /// @returns "No logs available for server: <id>" or "Logs for server <id>:" followed by one line per output line
    std::string showLogs(const ServerId& id) const noexcept;

    /// @brief Returns a snapshot of the captured output lines of a server.
    /// @error serverstarter::SupervisorErrc::kNoLogsAvailable if nothing is registered for id
    score::Result<std::vector<std::string>> getLogs(const ServerId& id) const noexcept;

    /// @brief Removes all registry state of a server, unless its process is still alive.
    void cleanupResources(const ServerId& id) noexcept;

    ServerState getState(const ServerId& id) const noexcept;

    /// @brief Returns true while the process of id is published and alive.
    bool isRunning(const ServerId& id) const noexcept;

    std::vector<ServerId> getServerIds() const noexcept;

    /// @brief Builds the launch command line of a server, see serverstarter::internal::buildCommand().
    static std::string buildCommand(const ServerDescriptor& descriptor);

   private:
    /// @brief Pointer to implementation (Pimpl), we use this pattern to provide ABI compatibility.
    std::unique_ptr<internal::ProcessSupervisorImpl> process_supervisor_impl_;
};

}  // namespace serverstarter

#endif  // SERVERSTARTER_PROCESS_SUPERVISOR_HPP_INCLUDED
