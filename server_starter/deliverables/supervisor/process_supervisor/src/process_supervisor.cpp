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
#include <serverstarter/process_supervisor.hpp>

#include <exception>

namespace serverstarter {

SupervisorSettings::SupervisorSettings()
    : stop_timeout_(internal::kStopTimeout), output_poll_interval_(internal::kOutputPollInterval) {
}

ProcessSupervisor::ProcessSupervisor() noexcept : ProcessSupervisor(nullptr) {
}

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<ILifecycleObserver> observer,
                                     SupervisorSettings settings) noexcept {
    try {
        process_supervisor_impl_ = std::make_unique<internal::ProcessSupervisorImpl>(
            std::make_shared<internal::osal::PosixProcess>(), std::move(observer), settings);
    } catch (const std::exception& error) {
        SST_LOG_FATAL() << "Unable to create process supervisor:" << error.what();
        process_supervisor_impl_ = nullptr;
    }
}

ProcessSupervisor::~ProcessSupervisor() noexcept {
    process_supervisor_impl_.reset();
}

ProcessSupervisor::ProcessSupervisor(ProcessSupervisor&& rval) noexcept {
    process_supervisor_impl_ = std::move(rval.process_supervisor_impl_);
    rval.process_supervisor_impl_ = nullptr;
}

ProcessSupervisor& ProcessSupervisor::operator=(ProcessSupervisor&& rval) noexcept = default;

void ProcessSupervisor::start(const ServerId& id, const ServerDescriptor& descriptor) noexcept {
    if (process_supervisor_impl_ != nullptr) {
        try {
            process_supervisor_impl_->start(id, descriptor);
        } catch (const std::exception& error) {
            SST_LOG_ERROR() << "start() of" << id.str() << "failed:" << error.what();
        }
    }
}

void ProcessSupervisor::stop(const ServerId& id) noexcept {
    if (process_supervisor_impl_ != nullptr) {
        try {
            process_supervisor_impl_->stop(id);
        } catch (const std::exception& error) {
            SST_LOG_ERROR() << "stop() of" << id.str() << "failed:" << error.what();
        }
    }
}

void ProcessSupervisor::stopAll() noexcept {
    if (process_supervisor_impl_ != nullptr) {
        try {
            process_supervisor_impl_->stopAll();
        } catch (const std::exception& error) {
            SST_LOG_ERROR() << "stopAll() failed:" << error.what();
        }
    }
}

score::Result<std::monostate> ProcessSupervisor::execute(const ServerId& id, std::string_view command) noexcept {
    score::Result<std::monostate> retVal_{score::MakeUnexpected(SupervisorErrc::kGeneralError)};

    if (process_supervisor_impl_ != nullptr) {
        try {
            retVal_ = process_supervisor_impl_->execute(id, command);
        } catch (const std::exception& error) {
            SST_LOG_ERROR() << "execute() on" << id.str() << "failed:" << error.what();
        }
    }

    return retVal_;
}

std::string ProcessSupervisor::showLogs(const ServerId& id) const noexcept {
    std::string retVal_{};

    try {
        retVal_ = (process_supervisor_impl_ != nullptr) ? process_supervisor_impl_->showLogs(id)
                                                        : "No logs available for server: " + id.str();
    } catch (const std::exception& error) {
        SST_LOG_ERROR() << "showLogs() of" << id.str() << "failed:" << error.what();
    }

    return retVal_;
}

score::Result<std::vector<std::string>> ProcessSupervisor::getLogs(const ServerId& id) const noexcept {
    score::Result<std::vector<std::string>> retVal_{score::MakeUnexpected(SupervisorErrc::kNoLogsAvailable)};

    if (process_supervisor_impl_ != nullptr) {
        try {
            retVal_ = process_supervisor_impl_->getLogs(id);
        } catch (const std::exception& error) {
            SST_LOG_ERROR() << "getLogs() of" << id.str() << "failed:" << error.what();
            retVal_ = score::Result<std::vector<std::string>>{score::MakeUnexpected(SupervisorErrc::kGeneralError)};
        }
    }

    return retVal_;
}

void ProcessSupervisor::cleanupResources(const ServerId& id) noexcept {
    if (process_supervisor_impl_ != nullptr) {
        try {
            process_supervisor_impl_->cleanupResources(id);
        } catch (const std::exception& error) {
            SST_LOG_ERROR() << "cleanupResources() of" << id.str() << "failed:" << error.what();
        }
    }
}

ServerState ProcessSupervisor::getState(const ServerId& id) const noexcept {
    return (process_supervisor_impl_ != nullptr) ? process_supervisor_impl_->getState(id) : ServerState::kAbsent;
}

bool ProcessSupervisor::isRunning(const ServerId& id) const noexcept {
    return getState(id) == ServerState::kRunning;
}

std::vector<ServerId> ProcessSupervisor::getServerIds() const noexcept {
    std::vector<ServerId> retVal_{};

    if (process_supervisor_impl_ != nullptr) {
        try {
            retVal_ = process_supervisor_impl_->getServerIds();
        } catch (const std::exception& error) {
            SST_LOG_ERROR() << "getServerIds() failed:" << error.what();
        }
    }

    return retVal_;
}

std::string ProcessSupervisor::buildCommand(const ServerDescriptor& descriptor) {
    return internal::buildCommand(descriptor);
}

}  // namespace serverstarter
