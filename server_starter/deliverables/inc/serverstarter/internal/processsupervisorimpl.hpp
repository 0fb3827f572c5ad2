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



#ifndef SST_PROCESS_SUPERVISOR_IMPL_HPP_INCLUDED
#define SST_PROCESS_SUPERVISOR_IMPL_HPP_INCLUDED

#include <serverstarter/internal/osal/iprocess.hpp>
#include <serverstarter/internal/processregistry.hpp>
#include <serverstarter/internal/taskspawner.hpp>
#include <serverstarter/lifecycle_observer.hpp>
#include <serverstarter/server_descriptor.hpp>
#include <serverstarter/server_id.hpp>
#include <serverstarter/server_state.hpp>
#include <serverstarter/supervisor_settings.hpp>
#include "score/result/result.h"

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace serverstarter {

namespace internal {

/// @brief Implementation of the process supervisor: lifecycle controller and log pump on top of the registry.
///
/// Each accepted start() runs one supervising task on the task spawner. The task spawns the OS process, publishes it,
/// drains its output into the log buffer until the stream closes, waits for the exit and cleans up.
/// stop() and execute() act on the published process concurrently with the task.
class ProcessSupervisorImpl final {
   public:
    /// @brief Creates a supervisor.
    /// @param process_interface  Used to spawn child processes.
    /// @param observer           Notified about every lifecycle transition.
    /// @param settings           Timeouts and polling intervals.
    ProcessSupervisorImpl(std::shared_ptr<osal::IProcess> process_interface,
                          std::shared_ptr<ILifecycleObserver> observer,
                          SupervisorSettings settings);

    /// @brief Stops every server, then cancels and joins all supervising tasks.
    ~ProcessSupervisorImpl();

    // Rule of five
    /// @brief Copy constructor is deleted to prevent copying.
    ProcessSupervisorImpl(const ProcessSupervisorImpl&) = delete;

    /// @brief Copy assignment operator is deleted to prevent copying.
    ProcessSupervisorImpl& operator=(const ProcessSupervisorImpl&) = delete;

    /// @brief Move constructor is deleted, running tasks refer to this object.
    ProcessSupervisorImpl(ProcessSupervisorImpl&&) = delete;

    /// @brief Move assignment operator is deleted, running tasks refer to this object.
    ProcessSupervisorImpl& operator=(ProcessSupervisorImpl&&) = delete;

    void start(const ServerId& id, const ServerDescriptor& descriptor);
    void stop(const ServerId& id);
    void stopAll();
    score::Result<std::monostate> execute(const ServerId& id, std::string_view command);
    std::string showLogs(const ServerId& id) const;
    score::Result<std::vector<std::string>> getLogs(const ServerId& id) const;
    void cleanupResources(const ServerId& id);
    ServerState getState(const ServerId& id) const;
    std::vector<ServerId> getServerIds() const;

    /// @brief Direct access to the registry, for diagnostics and tests.
    const ProcessRegistry& registry() const noexcept;

   private:
    /// @brief Body of the supervising task of one server generation.
    void supervise(const ServerId& id, const std::shared_ptr<RegistryEntry>& entry,
                   const std::shared_ptr<const ServerDescriptor>& descriptor, const osal::OsalConfig& config,
                   const score::cpp::stop_token& token);

    /// @brief Log pump, appends "[<name>]<line>" to the log buffer of entry for every output line.
    /// @return kFail when the output stream is exhausted, kCancelled when a stop was requested.
    osal::OsalReturnType pumpOutput(const ServerId& id, const RegistryEntry& entry, osal::IChildProcess& process,
                                    const std::string& name, const score::cpp::stop_token& token);

    /// @brief Kills a process that can no longer be reached through the registry.
    void terminateOrphan(const ServerId& id, osal::IChildProcess& process);

    /// @brief Removes the given generation of id, unless its process is alive.
    void cleanupEntry(const ServerId& id, const std::shared_ptr<RegistryEntry>& entry);

    void notify(const ServerId& id, LifecycleEvent event, std::string_view detail) const noexcept;

    std::shared_ptr<osal::IProcess> process_interface_;
    std::shared_ptr<ILifecycleObserver> observer_;
    const SupervisorSettings settings_;
    ProcessRegistry registry_{};
    TaskSpawner spawner_{};
};

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_PROCESS_SUPERVISOR_IMPL_HPP_INCLUDED
