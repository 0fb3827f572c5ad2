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


#include <serverstarter/internal/commandbuilder.hpp>
#include <serverstarter/internal/config.hpp>
#include <serverstarter/internal/log.hpp>
#include <serverstarter/internal/osal/posixprocess.hpp>
#include <serverstarter/internal/processsupervisorimpl.hpp>
#include <serverstarter/supervisor_error_domain.h>

#include <exception>
#include <string>
#include <utility>

namespace serverstarter {

namespace internal {

using osal::OsalReturnType;

ProcessSupervisorImpl::ProcessSupervisorImpl(std::shared_ptr<osal::IProcess> process_interface,
                                             std::shared_ptr<ILifecycleObserver> observer,
                                             SupervisorSettings settings)
    : process_interface_(std::move(process_interface)), observer_(std::move(observer)), settings_(settings) {
    if (!process_interface_) {
        process_interface_ = std::make_shared<osal::PosixProcess>();
    }

    if (!observer_) {
        observer_ = std::make_shared<LoggingLifecycleObserver>();
    }
}

ProcessSupervisorImpl::~ProcessSupervisorImpl() {
    try {
        stopAll();
    } catch (const std::exception& error) {
        SST_LOG_ERROR() << "Stopping servers on shutdown failed:" << error.what();
    }
    spawner_.shutdown();
}

void ProcessSupervisorImpl::notify(const ServerId& id, LifecycleEvent event, std::string_view detail) const noexcept {
    observer_->onLifecycleEvent(id, event, detail);
}

void ProcessSupervisorImpl::start(const ServerId& id, const ServerDescriptor& descriptor) {
    auto buffer = std::make_shared<LogBuffer>();
    auto task = std::make_shared<SupervisionTask>();
    auto entry = registry_.insertIfAbsent(id, buffer, task);

    if (!entry) {
        notify(id, LifecycleEvent::kStartIgnored, "already registered");
        return;
    }

    bool spawned = false;

    try {
        const std::string command = buildCommand(descriptor);
        notify(id, LifecycleEvent::kStartRequested, command);

        osal::OsalConfig config;
        config.short_name_ = descriptor.name_;
        config.argv_ = splitCommand(command);
        config.output_poll_interval_ = settings_.output_poll_interval_;

        auto shared_descriptor = std::make_shared<const ServerDescriptor>(descriptor);

        spawned = spawner_.spawn(
            task, [this, id, entry, shared_descriptor, config](const score::cpp::stop_token& token) {
                supervise(id, entry, shared_descriptor, config, token);
            });
    } catch (const std::exception& error) {
        SST_LOG_ERROR() << "Start of" << id.str() << "aborted:" << error.what();
    }

    if (!spawned) {
        notify(id, LifecycleEvent::kStartFailed, "unable to create supervising task");
        cleanupEntry(id, entry);
    }
}

void ProcessSupervisorImpl::supervise(const ServerId& id, const std::shared_ptr<RegistryEntry>& entry,
                                      const std::shared_ptr<const ServerDescriptor>& descriptor,
                                      const osal::OsalConfig& config, const score::cpp::stop_token& token) {
    if (token.stop_requested()) {
        notify(id, LifecycleEvent::kTaskCancelled, "before the process was spawned");
        cleanupEntry(id, entry);
        return;
    }

    std::shared_ptr<osal::IChildProcess> process;

    if (process_interface_->startProcess(process, config) != OsalReturnType::kSuccess || !process) {
        notify(id, LifecycleEvent::kStartFailed, config.argv_.empty() ? std::string{} : config.argv_.front());
        cleanupEntry(id, entry);
        return;
    }

    if (!entry->attach(descriptor, process)) {
        // cleaned up while spawning, nobody could ever stop this process
        terminateOrphan(id, *process);
        return;
    }

    notify(id, LifecycleEvent::kProcessStarted, "pid " + std::to_string(process->getPid()));

    OsalReturnType result = pumpOutput(id, *entry, *process, descriptor->name_, token);

    if (result != OsalReturnType::kCancelled) {
        result = process->waitForExit(token);
    }

    if (result == OsalReturnType::kCancelled) {
        notify(id, LifecycleEvent::kTaskCancelled, "process left to stop()");
    } else {
        notify(id, LifecycleEvent::kProcessExited, "wait status " + std::to_string(process->exitStatus()));
    }

    cleanupEntry(id, entry);
    SST_LOG_DEBUG() << "Supervising task of" << id.str() << "finished";
}

OsalReturnType ProcessSupervisorImpl::pumpOutput(const ServerId& id, const RegistryEntry& entry,
                                                 osal::IChildProcess& process, const std::string& name,
                                                 const score::cpp::stop_token& token) {
    std::string line;
    OsalReturnType result;

    while ((result = process.readLine(line, token)) == OsalReturnType::kSuccess) {
        auto buffer = entry.getLogBuffer();

        if (!buffer) {
            // output arriving after cleanup is dropped, no fresh buffer is created
            SST_LOG_WARN() << "Log buffer of" << id.str() << "was removed, discarding further output";
            return OsalReturnType::kFail;
        }

        buffer->append("[" + name + "]" + line);
    }

    return result;
}

void ProcessSupervisorImpl::terminateOrphan(const ServerId& id, osal::IChildProcess& process) {
    SST_LOG_ERROR() << "Registry entry of" << id.str() << "was removed while spawning, killing pid"
                    << process.getPid();
    notify(id, LifecycleEvent::kForcedTermination, "process spawned after cleanup");

    if (process.forceTermination() != OsalReturnType::kSuccess ||
        process.waitForExit(kMaxSigKillDelay) != OsalReturnType::kSuccess) {
        SST_LOG_ERROR() << "Orphaned process" << process.getPid() << "of" << id.str() << "did not terminate";
    }
}

void ProcessSupervisorImpl::stop(const ServerId& id) {
    auto entry = registry_.getEntry(id);
    std::shared_ptr<osal::IChildProcess> process;

    if (entry) {
        auto task = entry->getTask();
        if (task && task->cancel()) {
            SST_LOG_DEBUG() << "Cancellation requested for supervising task of" << id.str();
        }
        process = entry->getProcess();
    }

    if (!process || !process->isAlive()) {
        notify(id, LifecycleEvent::kNoActiveProcess, "stop");
    } else {
        auto descriptor = entry->getDescriptor();
        std::string stop_command{(descriptor && descriptor->is_proxy_) ? kProxyStopCommand : kServerStopCommand};
        stop_command.push_back('\n');

        OsalReturnType written;
        {
            std::lock_guard<std::mutex> lock(entry->inputMutex());
            written = process->writeInput(stop_command);
        }

        if (written != OsalReturnType::kSuccess) {
            notify(id, LifecycleEvent::kStopCommandFailed, "unable to write to process input");
        } else {
            notify(id, LifecycleEvent::kStopCommandSent, stop_command.substr(0U, stop_command.find('\n')));

            if (process->waitForExit(settings_.stop_timeout_) == OsalReturnType::kSuccess) {
                notify(id, LifecycleEvent::kTerminatedGracefully, "");
            } else {
                notify(id, LifecycleEvent::kForcedTermination,
                       "no exit within " + std::to_string(settings_.stop_timeout_.count()) + " ms");

                if (process->forceTermination() != OsalReturnType::kSuccess) {
                    SST_LOG_ERROR() << "Forced termination of" << id.str() << "failed";
                } else if (process->waitForExit(kMaxSigKillDelay) != OsalReturnType::kSuccess) {
                    SST_LOG_ERROR() << "Process of" << id.str() << "did not terminate after SIGKILL within"
                                    << kMaxSigKillDelay.count() << "ms";
                }
            }
        }
    }

    if (entry) {
        cleanupEntry(id, entry);
    }
}

void ProcessSupervisorImpl::stopAll() {
    for (const auto& id : registry_.ids()) {
        stop(id);
    }
}

score::Result<std::monostate> ProcessSupervisorImpl::execute(const ServerId& id, std::string_view command) {
    auto entry = registry_.getEntry(id);
    auto process = entry ? entry->getProcess() : nullptr;

    if (!process || !process->isAlive()) {
        notify(id, LifecycleEvent::kNoActiveProcess, "execute");
        return score::Result<std::monostate>{};
    }

    // re-validate after re-fetching, the process may have been replaced or exited in between
    process = entry->getProcess();

    if (!process || !process->isAlive()) {
        notify(id, LifecycleEvent::kNoActiveProcess, "execute");
        return score::Result<std::monostate>{};
    }

    std::string line{command};
    line.push_back('\n');

    OsalReturnType written;
    {
        std::lock_guard<std::mutex> lock(entry->inputMutex());
        written = process->writeInput(line);
    }

    if (written != OsalReturnType::kSuccess) {
        notify(id, LifecycleEvent::kCommandFailed, command);
        return score::Result<std::monostate>{score::MakeUnexpected(SupervisorErrc::kCommandFailed)};
    }

    notify(id, LifecycleEvent::kCommandSent, command);
    return score::Result<std::monostate>{};
}

std::string ProcessSupervisorImpl::showLogs(const ServerId& id) const {
    auto buffer = registry_.getLogBuffer(id);

    if (!buffer) {
        return "No logs available for server: " + id.str();
    }

    return "Logs for server " + id.str() + ":\n" + buffer->toString();
}

score::Result<std::vector<std::string>> ProcessSupervisorImpl::getLogs(const ServerId& id) const {
    auto buffer = registry_.getLogBuffer(id);

    if (!buffer) {
        return score::Result<std::vector<std::string>>{score::MakeUnexpected(SupervisorErrc::kNoLogsAvailable)};
    }

    return score::Result<std::vector<std::string>>{buffer->snapshot()};
}

void ProcessSupervisorImpl::cleanupResources(const ServerId& id) {
    cleanupEntry(id, nullptr);
}

void ProcessSupervisorImpl::cleanupEntry(const ServerId& id, const std::shared_ptr<RegistryEntry>& entry) {
    switch (registry_.removeUnlessAlive(id, entry)) {
        case RemovalResult::kRemoved:
            notify(id, LifecycleEvent::kCleanedUp, "");
            break;

        case RemovalResult::kProcessAlive:
            notify(id, LifecycleEvent::kCleanupRefused, "process is still alive");
            break;

        default:
            SST_LOG_DEBUG() << "Nothing to clean up for" << id.str();
            break;
    }
}

ServerState ProcessSupervisorImpl::getState(const ServerId& id) const {
    auto entry = registry_.getEntry(id);
    ServerState state = ServerState::kAbsent;

    if (entry) {
        auto process = entry->getProcess();

        if (!process) {
            state = ServerState::kStarting;
        } else if (process->isAlive()) {
            state = ServerState::kRunning;
        } else {
            state = ServerState::kExiting;
        }
    }

    return state;
}

std::vector<ServerId> ProcessSupervisorImpl::getServerIds() const {
    return registry_.ids();
}

const ProcessRegistry& ProcessSupervisorImpl::registry() const noexcept {
    return registry_;
}

}  // namespace internal

}  // namespace serverstarter
