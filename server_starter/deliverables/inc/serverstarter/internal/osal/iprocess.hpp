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



#ifndef SST_IPROCESS_HPP_INCLUDED
#define SST_IPROCESS_HPP_INCLUDED

#include <serverstarter/internal/config.hpp>
#include <serverstarter/internal/osal/osalreturntypes.hpp>
#include <score/stop_token.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace serverstarter {

namespace internal {

namespace osal {

/// @brief Represents process startup configuration consumed by OSAL.
// RULECHECKER_comment(1, 1, check_incomplete_data_member_construction, "This struct is POD, which doesn't have user-declared constructor. The rule doesn’t apply.", false)
struct OsalConfig {
    std::string short_name_{};       ///< Short name of the process, only used for diagnostics
    std::vector<std::string> argv_{};  ///< Command-line arguments, argv_[0] is resolved through PATH
    std::chrono::milliseconds output_poll_interval_{kOutputPollInterval};  ///< See kOutputPollInterval
};

///@brief Handle of one spawned child process, with its standard input and standard output attached to pipes.
/// Standard error of the child is inherited from the supervisor.
///
/// @threadsafety readLine() has a single caller (the supervising task). writeInput() callers must be serialised by
///               the owner. All other methods may be called from any thread.
class IChildProcess {
   public:
    virtual ~IChildProcess() = default;

    /// @brief Returns the process identifier of the child.
    virtual ProcessID getPid() const noexcept = 0;

    /// @brief Blocks until a complete line of output is available, the output stream closes or a stop is requested.
    /// The trailing line terminator ("\n" or "\r\n") is removed. A last line without terminator is returned when the
    /// stream closes.
    ///@param[out] line  Receives the line, unspecified unless kSuccess is returned.
    ///@param[in]  token Stop token observed while waiting for output.
    ///@return kSuccess when a line was read, kCancelled when a stop was requested, kFail when the stream is exhausted
    ///        or a read error occurred.
    virtual OsalReturnType readLine(std::string& line, const score::cpp::stop_token& token) = 0;

    /// @brief Writes all given bytes to the standard input of the child. Pipes are unbuffered, so a successful
    /// write is also flushed.
    ///@return kSuccess when all bytes were written, kFail otherwise (for example the child closed its input).
    virtual OsalReturnType writeInput(std::string_view data) = 0;

    /// @brief Returns true until the child has terminated.
    virtual bool isAlive() = 0;

    /// @brief Waits a bounded time for the child to terminate.
    ///@return kSuccess when the child terminated, kTimeout when it is still running after timeout.
    virtual OsalReturnType waitForExit(std::chrono::milliseconds timeout) = 0;

    /// @brief Waits until the child terminates or a stop is requested.
    ///@return kSuccess when the child terminated, kCancelled when a stop was requested first.
    virtual OsalReturnType waitForExit(const score::cpp::stop_token& token) = 0;

    ///@brief Forcibly terminates the child. On Posix based system this is implemented by sending SIGKILL.
    ///@return When SIGKILL was successfully sent, or the child is already reaped, kSuccess. Otherwise, kFail.
    virtual OsalReturnType forceTermination() = 0;

    /// @brief Returns the raw wait status of a terminated child, or -1 while it is running or when unknown.
    virtual std::int32_t exitStatus() const noexcept = 0;
};

///@brief This class provides the functionality needed to create child processes.
/// As a part of OSAL it also provides the porting interface of the supervisor.
class IProcess {
   public:
    virtual ~IProcess() = default;

    /// @brief Initiates the execution of a new process as described by config.
    /// The function reports whether the child process could be created and its program executed. When the executable
    /// cannot be found or executed this is reported as a failure, not as an early exit of the child.
    ///@param[out] child   Handle of the new child process, only set when kSuccess is returned.
    ///@param[in]  config  Process start-up configuration.
    ///@return kSuccess when the child runs the requested program, kFail otherwise.
    virtual OsalReturnType startProcess(std::shared_ptr<IChildProcess>& child, const OsalConfig& config) = 0;
};

}  // namespace osal

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_IPROCESS_HPP_INCLUDED
