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


#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <serverstarter/internal/log.hpp>
#include <serverstarter/internal/osal/posixprocess.hpp>
#include <serverstarter/internal/osal/sysexit.hpp>
#include <cerrno>
#include <cstring>
#include <thread>

constexpr int kPidZero = 0;  // This value is used to check if the process ID (uses pid_t) is valid or not.
constexpr int kPosixSuccess = 0;
constexpr int kExecFailedExitCode = 127;  // Exit code of a child whose exec failed, same as the shells use

namespace {

using serverstarter::internal::osal::sysexit;

/// @brief RAII wrapper for the two file descriptors of a pipe.
class PipeGuard final {
   public:
    PipeGuard() noexcept = default;

    ~PipeGuard() {
        closeRead();
        closeWrite();
    }

    PipeGuard(const PipeGuard&) = delete;
    PipeGuard& operator=(const PipeGuard&) = delete;
    PipeGuard(PipeGuard&&) = delete;
    PipeGuard& operator=(PipeGuard&&) = delete;

    /// @brief Creates the pipe with both ends marked close-on-exec, so that children spawned concurrently
    /// do not inherit descriptors of each other.
    bool create() noexcept {
        return pipe2(fd_, O_CLOEXEC) == kPosixSuccess;
    }

    int readEnd() const noexcept {
        return fd_[0];
    }

    int writeEnd() const noexcept {
        return fd_[1];
    }

    void closeRead() noexcept {
        if (fd_[0] >= 0) {
            close(fd_[0]);
            fd_[0] = -1;
        }
    }

    void closeWrite() noexcept {
        if (fd_[1] >= 0) {
            close(fd_[1]);
            fd_[1] = -1;
        }
    }

    int releaseRead() noexcept {
        int fd = fd_[0];
        fd_[0] = -1;
        return fd;
    }

    int releaseWrite() noexcept {
        int fd = fd_[1];
        fd_[1] = -1;
        return fd;
    }

   private:
    int fd_[2]{-1, -1};
};

/// @brief Runs in the forked child. Only async-signal-safe calls are allowed here, the parent is multithreaded.
[[noreturn]] void handleChildProcess(char* const* argv, const PipeGuard& input, const PipeGuard& output,
                                     const PipeGuard& exec_status) {
    int error = 0;

    // Own process group, so that terminal signals meant for the supervisor do not reach the server
    if (setpgid(0, 0) != kPosixSuccess) {
        error = errno;
    } else if (dup2(input.readEnd(), STDIN_FILENO) == -1 || dup2(output.writeEnd(), STDOUT_FILENO) == -1) {
        error = errno;
    } else {
        // restore default SIGPIPE disposition, the supervisor ignores it and ignored signals survive exec
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        execvp(argv[0], argv);
        error = errno;
    }

    // exec_status is close-on-exec, the parent only receives data when we never reached the new program
    ssize_t written;
    do {
        written = write(exec_status.writeEnd(), &error, sizeof(error));
    } while (written == -1 && errno == EINTR);

    sysexit(kExecFailedExitCode);
}

/// @brief Reads the errno reported by a child whose exec failed.
/// @return 0 when the exec succeeded (the pipe was closed without data), the errno of the child otherwise.
int readExecStatus(int fd) noexcept {
    int error = 0;
    ssize_t received;

    do {
        received = read(fd, &error, sizeof(error));
    } while (received == -1 && errno == EINTR);

    if (received == static_cast<ssize_t>(sizeof(error))) {
        return error;
    }

    return (received == 0) ? 0 : EIO;
}

}  // namespace

namespace serverstarter {

namespace internal {

namespace osal {

PosixChildProcess::PosixChildProcess(ProcessID pid, int input_fd, int output_fd,
                                     std::chrono::milliseconds poll_interval) noexcept
    : pid_(pid), input_fd_(input_fd), output_fd_(output_fd), poll_interval_(poll_interval) {
}

PosixChildProcess::~PosixChildProcess() {
    if (input_fd_ >= 0) {
        close(input_fd_);
        input_fd_ = -1;
    }

    if (output_fd_ >= 0) {
        close(output_fd_);
        output_fd_ = -1;
    }

    if (!tryReap()) {
        SST_LOG_WARN() << "Child process" << pid_ << "is still running while its handle is released";
    }
}

ProcessID PosixChildProcess::getPid() const noexcept {
    return pid_;
}

bool PosixChildProcess::takePendingLine(std::string& line) {
    const auto pos = pending_output_.find('\n');
    bool result = false;

    if (pos != std::string::npos) {
        line.assign(pending_output_, 0U, pos);
        pending_output_.erase(0U, pos + 1U);
        result = true;
    } else if (output_closed_ && !pending_output_.empty()) {
        line = std::move(pending_output_);
        pending_output_.clear();
        result = true;
    }

    if (result && !line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    return result;
}

OsalReturnType PosixChildProcess::readLine(std::string& line, const score::cpp::stop_token& token) {
    char chunk[kMaxOutputChunk];

    while (true) {
        if (takePendingLine(line)) {
            return OsalReturnType::kSuccess;
        }

        if (output_closed_) {
            return OsalReturnType::kFail;
        }

        if (token.stop_requested()) {
            return OsalReturnType::kCancelled;
        }

        pollfd pfd{output_fd_, POLLIN, 0};
        const int ready = poll(&pfd, 1U, static_cast<int>(poll_interval_.count()));

        if (ready == 0) {
            continue;
        }

        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            SST_LOG_ERROR() << "poll() on output of process" << pid_ << "failed:" << std::strerror(errno);
            return OsalReturnType::kFail;
        }

        const ssize_t received = read(output_fd_, chunk, sizeof(chunk));

        if (received > 0) {
            pending_output_.append(chunk, static_cast<std::size_t>(received));
        } else if (received == 0) {
            output_closed_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            SST_LOG_ERROR() << "read() on output of process" << pid_ << "failed:" << std::strerror(errno);
            return OsalReturnType::kFail;
        }
    }
}

OsalReturnType PosixChildProcess::writeInput(std::string_view data) {
    std::size_t offset = 0U;

    while (offset < data.size()) {
        const ssize_t written = write(input_fd_, data.data() + offset, data.size() - offset);

        if (written > 0) {
            offset += static_cast<std::size_t>(written);
        } else if (written == -1 && errno == EINTR) {
            continue;
        } else {
            SST_LOG_ERROR() << "write() to input of process" << pid_ << "failed:" << std::strerror(errno);
            return OsalReturnType::kFail;
        }
    }

    return OsalReturnType::kSuccess;
}

bool PosixChildProcess::tryReap() {
    std::lock_guard<std::mutex> lock(reap_mutex_);

    if (!reaped_) {
        int status = 0;
        const pid_t result = waitpid(pid_, &status, WNOHANG);

        if (result == pid_) {
            reaped_ = true;
            exit_status_ = status;
        } else if (result == -1 && errno != EINTR) {
            // ECHILD: somebody else reaped the child, there is nothing left to wait for
            SST_LOG_DEBUG() << "waitpid() for process" << pid_ << "failed:" << std::strerror(errno);
            reaped_ = true;
        }
    }

    return reaped_;
}

bool PosixChildProcess::isAlive() {
    return !tryReap();
}

OsalReturnType PosixChildProcess::waitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!tryReap()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return OsalReturnType::kTimeout;
        }
        std::this_thread::sleep_for(kExitPollResolution);
    }

    return OsalReturnType::kSuccess;
}

OsalReturnType PosixChildProcess::waitForExit(const score::cpp::stop_token& token) {
    while (!tryReap()) {
        if (token.stop_requested()) {
            return OsalReturnType::kCancelled;
        }
        std::this_thread::sleep_for(kExitPollResolution);
    }

    return OsalReturnType::kSuccess;
}

OsalReturnType PosixChildProcess::forceTermination() {
    SST_LOG_DEBUG() << "Forced termination received for pid" << pid_;

    std::lock_guard<std::mutex> lock(reap_mutex_);
    OsalReturnType result = OsalReturnType::kFail;

    if (reaped_) {
        // the pid may already belong to an unrelated process
        result = OsalReturnType::kSuccess;
    } else if (pid_ > kPidZero) {
        if (kill(pid_, SIGKILL) == kPosixSuccess) {
            result = OsalReturnType::kSuccess;
        } else if (errno == ESRCH) {
            SST_LOG_WARN() << "SIGKILL failed: Process is already gone (ESRCH) for process ID" << pid_;
        } else {
            SST_LOG_FATAL() << "SIGKILL failed: Unable to send SIGKILL to process ID" << pid_
                            << ". Error:" << std::strerror(errno);
        }
    } else {
        SST_LOG_ERROR() << "Invalid process ID: The process ID" << pid_ << "is invalid.";
    }

    return result;
}

std::int32_t PosixChildProcess::exitStatus() const noexcept {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    return exit_status_;
}

PosixProcess::PosixProcess() {
    // RULECHECKER_comment(1, 1, check_static_object_dynamic_initialization, "This is safe because the static is a function local.", true);
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, []() {
        if (signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
            SST_LOG_ERROR() << "Unable to ignore SIGPIPE:" << std::strerror(errno);
        }
    });
}

OsalReturnType PosixProcess::startProcess(std::shared_ptr<IChildProcess>& child, const OsalConfig& config) {
    if (config.argv_.empty() || config.argv_.front().empty()) {
        SST_LOG_ERROR() << "Invalid start-up configuration for" << config.short_name_ << ": empty command line";
        return OsalReturnType::kFail;
    }

    // argv is prepared before fork(), the child must not allocate
    std::vector<char*> argv;
    argv.reserve(config.argv_.size() + 1U);
    for (const auto& arg : config.argv_) {
        // RULECHECKER_comment(1, 1, check_pointer_qualifier_cast_const, "Remove const for standard library with char type arguments.", true);
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    PipeGuard input;
    PipeGuard output;
    PipeGuard exec_status;

    if (!input.create() || !output.create() || !exec_status.create()) {
        SST_LOG_ERROR() << "pipe2() failed: Unable to create pipes for" << config.short_name_
                        << ". Error:" << std::strerror(errno);
        return OsalReturnType::kFail;
    }

    const pid_t pid = fork();

    if (pid == -1) {
        SST_LOG_ERROR() << "fork() failed: Unable to start" << config.short_name_ << ". Error:" << std::strerror(errno);
        return OsalReturnType::kFail;
    }

    if (pid == kPidZero) {
        handleChildProcess(argv.data(), input, output, exec_status);
    }

    input.closeRead();
    output.closeWrite();
    exec_status.closeWrite();

    const int exec_error = readExecStatus(exec_status.readEnd());

    if (exec_error != 0) {
        SST_LOG_ERROR() << "execvp failed: Unable to execute" << config.argv_.front() << "for" << config.short_name_
                        << ". Error:" << std::strerror(exec_error);
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        return OsalReturnType::kFail;
    }

    SST_LOG_DEBUG() << "Started" << config.short_name_ << "with pid" << pid;
    child = std::make_shared<PosixChildProcess>(pid, input.releaseWrite(), output.releaseRead(),
                                                config.output_poll_interval_);

    return OsalReturnType::kSuccess;
}

}  // namespace osal

}  // namespace internal

}  // namespace serverstarter
