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

#include <sstream>

namespace serverstarter {

namespace internal {

std::string buildCommand(const ServerDescriptor& descriptor) {
    SST_LOG_DEBUG() << "Building command for" << descriptor.name_;

    std::ostringstream command;

    if (descriptor.interpreter_path_.empty()) {
        command << kDefaultInterpreter;
    } else {
        command << descriptor.interpreter_path_;
    }

    command << " -Xms" << descriptor.min_memory_mb_ << "M";
    command << " -Xmx" << descriptor.max_memory_mb_ << "M";
    command << " -XX:+UseG1GC";

    if (!descriptor.is_proxy_) {
        command << " -Dcom.mojang.eula.agree=true";
        command << " -DIReallyKnowWhatIAmDoingISwear";
    }

    command << " -jar " << descriptor.server_software_path_;
    command << " --port " << descriptor.port_;

    if (!descriptor.is_proxy_) {
        command << " nogui";
    }

    return command.str();
}

std::vector<std::string> splitCommand(std::string_view command) {
    std::vector<std::string> tokens;
    std::size_t start = 0U;

    while (start <= command.size()) {
        auto end = command.find(' ', start);
        if (end == std::string_view::npos) {
            end = command.size();
        }

        tokens.emplace_back(command.substr(start, end - start));
        start = end + 1U;
    }

    // interior empty tokens are kept as empty arguments, trailing ones are not
    while (!tokens.empty() && tokens.back().empty()) {
        tokens.pop_back();
    }

    return tokens;
}

}  // namespace internal

}  // namespace serverstarter
