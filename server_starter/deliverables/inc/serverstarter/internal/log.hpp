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


#ifndef SST_LOG_HPP_INCLUDED
#define SST_LOG_HPP_INCLUDED

// Compile time switch to use different logging subsystems.
// The supervisor library is linked into host applications, so it inherits the logging
// mechanism of the binary it is linked into.

#ifdef SST_LOG_SCORE_MW_LOG

#include "score/mw/log/logger.h"

namespace serverstarter {

namespace internal {

/// @brief Function to access the global logging context of the server starter.
/// The supervisor uses a single global logging context, stored as a static variable inside this function.
/// Code should not call this function directly, but should use the set of wrapper macros below.
inline score::mw::log::Logger& _getSstLogger() noexcept {
    // RULECHECKER_comment(1, 1, check_static_object_dynamic_initialization, "This is safe because the static is a function local.", true);
    static score::mw::log::Logger& log{score::mw::log::CreateLogger("SST", "Server starter logging context")};
    return log;
}

}  // namespace internal

}  // namespace serverstarter

#else  // SST_LOG_SCORE_MW_LOG

// The only other solution supported is console logging.
#include <atomic>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace serverstarter {

namespace internal {

enum class LogLevel
{
    kFatal = 0,
    kError = 1,
    kWarn = 2,
    kInfo = 3,
    kDebug = 4,
    kVerbose = 5,
};

inline LogLevel GetLevelFromEnv() {
    if (const char* levelStr = std::getenv("SST_STDOUT_LOG_LEVEL")) {
        int logLevelTmp;
        try {
            logLevelTmp = std::stoi(std::string{levelStr});
        } catch (const std::exception&) {
            return LogLevel::kInfo;
        }

        if (logLevelTmp >= static_cast<int>(LogLevel::kFatal) && logLevelTmp <= static_cast<int>(LogLevel::kVerbose)) {
            return LogLevel(logLevelTmp);
        } else {
            return LogLevel::kInfo;
        }

    } else {
        return LogLevel::kInfo;
    }
}

inline LogLevel GetLevel() {
    const static LogLevel logLevel = GetLevelFromEnv();
    return logLevel;
}

inline std::ostream& operator<<(std::ostream& os, const std::tm* now) {
    os << (now->tm_year + 1900) << '/'
       << (now->tm_mon + 1) << '/'
       << now->tm_mday << " "
       << now->tm_hour << ":"
       << now->tm_min << ":"
       << now->tm_sec;
    return os;
}

/// @brief Serialises whole log lines written by different supervising threads.
inline std::mutex& _getConsoleMutex() noexcept {
    // RULECHECKER_comment(1, 1, check_static_object_dynamic_initialization, "This is safe because the static is a function local.", true);
    static std::mutex console_mutex;
    return console_mutex;
}

class Stream
{
public:
    Stream() noexcept = default;
    Stream(const Stream &) = delete;
    Stream(Stream && other) noexcept : buffer_(std::move(other.buffer_)) {
        print_ = other.print_;
        moved_ = true;
        other.print_ = false;
    };

    void SetPrint() {
        print_ = true;
    }

    template <typename T>
    Stream& operator<<(const T* value) noexcept
    {
        if(print_)
            buffer_ << " " << value;
        return *this;
    }

    template <typename T>
    Stream& operator<<(const T& value) noexcept
    {
        if(print_)
            buffer_ << " " << value;
        return *this;
    }

    ~Stream()
    {
        if(print_ && moved_) {
            std::lock_guard<std::mutex> lock(_getConsoleMutex());
            std::cout << buffer_.str() << " ]" << reset_color_ << std::endl;
        }
    }
private:
    bool print_{false};
    bool moved_{false};
    std::ostringstream buffer_{};
    std::string_view reset_color_{"\033[0m"};
};

class Logger
{
public:
    Logger(std::string_view f_context, std::string_view f_description) :
        ctxId_(f_context), ctxDescription_{f_description} {

    }

    Stream LogFatal() noexcept
    {
        return open(LogLevel::kFatal, "FATAL:   [", true);
    }

    Stream LogError() noexcept
    {
        return open(LogLevel::kError, "ERROR:   [", true);
    }

    Stream LogWarn() noexcept
    {
        return open(LogLevel::kWarn, "WARNING: [", true);
    }

    Stream LogInfo() noexcept
    {
        return open(LogLevel::kInfo, "INFO:    [", false);
    }

    Stream LogDebug() noexcept
    {
        return open(LogLevel::kDebug, "DEBUG:  [", false);
    }

    Stream LogVerbose() noexcept
    {
        return open(LogLevel::kVerbose, "VERBOSE: [", false);
    }
private:
    Stream open(LogLevel level, std::string_view tag, bool highlight) noexcept
    {
        Stream stream;
        if(GetLevel() >= level) {
            stream.SetPrint();
            std::time_t t = std::time(0);
            std::tm now;
            localtime_r(&t, &now);
            if(highlight) {
                stream << check_it_;
            }
            stream << text_color_ << &now << appId_ << ctxId_ << tag;
        }
        return std::move(stream);
    }

    const std::string_view appId_{"SRVS"};
    const std::string_view ctxId_{"####"};
    const std::string_view ctxDescription_{"####"};
    const std::string_view text_color_{"\033[0;34m"};
    const std::string_view check_it_{"\033[101;30m !!! -> \033[0m"};
};

inline Logger& _getSstLogger() noexcept {
    // RULECHECKER_comment(1, 1, check_static_object_dynamic_initialization, "This is safe because the static is a function local.", true);
    static Logger log{"SST", "Server starter logging context"};
    return log;
}

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_LOG_SCORE_MW_LOG

// wrapper macros for the server starter
#define SST_LOG_FATAL() (serverstarter::internal::_getSstLogger().LogFatal())
#define SST_LOG_ERROR() (serverstarter::internal::_getSstLogger().LogError())
#define SST_LOG_WARN() (serverstarter::internal::_getSstLogger().LogWarn())
#define SST_LOG_INFO() (serverstarter::internal::_getSstLogger().LogInfo())
#define SST_LOG_DEBUG() (serverstarter::internal::_getSstLogger().LogDebug())

#endif  // SST_LOG_HPP_INCLUDED
