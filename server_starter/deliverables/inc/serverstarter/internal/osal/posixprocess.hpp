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



#ifndef SST_POSIX_PROCESS_HPP_INCLUDED
#define SST_POSIX_PROCESS_HPP_INCLUDED

#include <serverstarter/internal/osal/iprocess.hpp>

#include <mutex>

namespace serverstarter {

namespace internal {

namespace osal {

/// @brief Child process created with fork() and execvp(), connected to the supervisor by two pipes.
class PosixChildProcess final : public IChildProcess {
   public:
    /// @brief Takes ownership of the pipe ends of an already running child.
    /// @param pid            Process identifier of the child.
    /// @param input_fd       Write end of the pipe connected to the standard input of the child.
    /// @param output_fd      Read end of the pipe connected to the standard output of the child.
    /// @param poll_interval  Granularity at which a blocked readLine() checks its stop token.
    PosixChildProcess(ProcessID pid, int input_fd, int output_fd, std::chrono::milliseconds poll_interval) noexcept;

    /// @brief Closes both pipe ends. A child that already terminated but was not reaped yet is reaped.
    ~PosixChildProcess() override;

    // Rule of five
    /// @brief Copy constructor is deleted, the object owns file descriptors.
    PosixChildProcess(const PosixChildProcess&) = delete;

    /// @brief Copy assignment operator is deleted, the object owns file descriptors.
    PosixChildProcess& operator=(const PosixChildProcess&) = delete;

    /// @brief Move constructor is deleted to prevent moving.
    PosixChildProcess(PosixChildProcess&&) = delete;

    /// @brief Move assignment operator is deleted to prevent moving.
    PosixChildProcess& operator=(PosixChildProcess&&) = delete;

    ProcessID getPid() const noexcept override;
    OsalReturnType readLine(std::string& line, const score::cpp::stop_token& token) override;
    OsalReturnType writeInput(std::string_view data) override;
    bool isAlive() override;
    OsalReturnType waitForExit(std::chrono::milliseconds timeout) override;
    OsalReturnType waitForExit(const score::cpp::stop_token& token) override;
    OsalReturnType forceTermination() override;
    std::int32_t exitStatus() const noexcept override;

   private:
    /// @brief Non-blocking check for termination of the child, reaps it on the first positive answer.
    /// @return true once the child has terminated.
    bool tryReap();

    /// @brief Moves the next complete line from pending_output_ into line.
    bool takePendingLine(std::string& line);

    const ProcessID pid_;
    int input_fd_;
    int output_fd_;
    const std::chrono::milliseconds poll_interval_;

    /// @brief Bytes read from the child that do not form a complete line yet.
    std::string pending_output_{};

    /// @brief Set once the output pipe reported end of file.
    bool output_closed_{false};

    /// @brief Protects reaped_ and exit_status_, waitpid() must run for the child exactly once.
    mutable std::mutex reap_mutex_{};
    bool reaped_{false};
    std::int32_t exit_status_{-1};
};

/// @brief Posix implementation of process creation.
class PosixProcess final : public IProcess {
   public:
    /// @brief Ignores SIGPIPE for the whole supervisor process, so that writing to a child that closed its
    /// input reports EPIPE instead of terminating the supervisor.
    PosixProcess();

    OsalReturnType startProcess(std::shared_ptr<IChildProcess>& child, const OsalConfig& config) override;
};

}  // namespace osal

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_POSIX_PROCESS_HPP_INCLUDED
