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



#ifndef SERVER_DESCRIPTOR_HPP_INCLUDED
#define SERVER_DESCRIPTOR_HPP_INCLUDED

#include <cstdint>
#include <string>

namespace serverstarter {

/// @file server_descriptor.hpp
/// @brief Static description of one server instance, as handed over by the component that owns server configuration.

/// @brief Immutable configuration for one server instance.
/// The supervisor takes a copy when a start is accepted and never modifies it afterwards.
// RULECHECKER_comment(1, 1, check_incomplete_data_member_construction, "This struct is POD, which doesn't have user-declared constructor. The rule doesn’t apply.", false)
struct ServerDescriptor {
    std::string name_{};                  ///< Human readable name, used as prefix for every captured output line
    std::string interpreter_path_{};      ///< Path to the interpreter, empty means the default interpreter ("java")
    std::uint32_t min_memory_mb_{0U};     ///< Initial heap size in megabytes (-Xms)
    std::uint32_t max_memory_mb_{0U};     ///< Maximum heap size in megabytes (-Xmx)
    std::string server_software_path_{};  ///< Path to the server software archive passed with -jar
    std::uint16_t port_{0U};              ///< Network port the server listens on
    bool is_proxy_{false};                ///< True for proxy servers, which use a different launch line and stop command
};

}  // namespace serverstarter

#endif  // SERVER_DESCRIPTOR_HPP_INCLUDED
