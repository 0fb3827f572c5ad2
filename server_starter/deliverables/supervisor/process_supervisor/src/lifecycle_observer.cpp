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


#include <serverstarter/internal/log.hpp>
#include <serverstarter/lifecycle_observer.hpp>

namespace serverstarter {

std::string_view toString(LifecycleEvent event) noexcept {
    switch (event) {
        case LifecycleEvent::kStartRequested:
            return "start requested";
        case LifecycleEvent::kStartIgnored:
            return "start ignored";
        case LifecycleEvent::kProcessStarted:
            return "process started";
        case LifecycleEvent::kStartFailed:
            return "start failed";
        case LifecycleEvent::kTaskCancelled:
            return "task cancelled";
        case LifecycleEvent::kProcessExited:
            return "process exited";
        case LifecycleEvent::kNoActiveProcess:
            return "no active process";
        case LifecycleEvent::kStopCommandSent:
            return "stop command sent";
        case LifecycleEvent::kStopCommandFailed:
            return "stop command failed";
        case LifecycleEvent::kTerminatedGracefully:
            return "terminated gracefully";
        case LifecycleEvent::kForcedTermination:
            return "forced termination";
        case LifecycleEvent::kCommandSent:
            return "command sent";
        case LifecycleEvent::kCommandFailed:
            return "command failed";
        case LifecycleEvent::kCleanupRefused:
            return "cleanup refused";
        case LifecycleEvent::kCleanedUp:
            return "cleaned up";
        default:
            return "unknown";
    }
}

void LoggingLifecycleObserver::onLifecycleEvent(const ServerId& id, LifecycleEvent event,
                                                std::string_view detail) noexcept {
    switch (event) {
        case LifecycleEvent::kStartFailed:
        case LifecycleEvent::kStopCommandFailed:
        case LifecycleEvent::kCommandFailed:
            SST_LOG_ERROR() << "Server" << id.str() << toString(event) << detail;
            break;

        case LifecycleEvent::kNoActiveProcess:
        case LifecycleEvent::kForcedTermination:
        case LifecycleEvent::kCleanupRefused:
            SST_LOG_WARN() << "Server" << id.str() << toString(event) << detail;
            break;

        case LifecycleEvent::kStartIgnored:
        case LifecycleEvent::kTaskCancelled:
        case LifecycleEvent::kCommandSent:
            SST_LOG_DEBUG() << "Server" << id.str() << toString(event) << detail;
            break;

        default:
            SST_LOG_INFO() << "Server" << id.str() << toString(event) << detail;
            break;
    }
}

}  // namespace serverstarter
