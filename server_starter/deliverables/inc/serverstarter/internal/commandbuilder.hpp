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



#ifndef SST_COMMAND_BUILDER_HPP_INCLUDED
#define SST_COMMAND_BUILDER_HPP_INCLUDED

#include <serverstarter/server_descriptor.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace serverstarter {

namespace internal {

/// @brief Builds the launch command line of a server.
/// The result is deterministic, tokens are separated by exactly one space:
///
///     <interpreter> -Xms<min>M -Xmx<max>M -XX:+UseG1GC
///     [-Dcom.mojang.eula.agree=true -DIReallyKnowWhatIAmDoingISwear]   (game servers only)
///     -jar <software> --port <port>
///     [nogui]                                                           (game servers only)
///
/// The only side effect is a debug trace.
/// @param descriptor Server to build the command line for. An empty interpreter path selects kDefaultInterpreter.
/// @return The command line as a single string.
std::string buildCommand(const ServerDescriptor& descriptor);

/// @brief Splits a command line into argv tokens on single spaces.
/// Consecutive spaces yield empty tokens, so an empty descriptor field stays an empty argument.
/// Trailing empty tokens are dropped.
std::vector<std::string> splitCommand(std::string_view command);

}  // namespace internal

}  // namespace serverstarter

#endif  // SST_COMMAND_BUILDER_HPP_INCLUDED
