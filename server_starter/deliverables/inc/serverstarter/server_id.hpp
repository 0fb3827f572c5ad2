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



#ifndef SERVER_ID_HPP_INCLUDED
#define SERVER_ID_HPP_INCLUDED

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace serverstarter {

/// @file server_id.hpp
/// @brief This file contains the declaration of the ServerId class,
///        which scopes all supervisor state that belongs to one server instance.

/// @brief Opaque identifier of a supervised server instance.
///
/// @details The value is supplied by the caller (usually a UUID string) or generated with ServerId::generate().
/// The supervisor never interprets the text, it only compares, hashes and prints it.
class ServerId final {
   public:
    /// @brief Constructs a ServerId object from the given text.
    /// @param id A std::string_view representing an ID.
    explicit ServerId(std::string_view id);

    /// @brief Constructs a ServerId object with the given text.
    /// @param id A C-string representing an ID. nullptr is treated as an empty string.
    explicit ServerId(const char* id);

    /// @brief Default constructor, creates an empty ID.
    ServerId() = default;

    // This class is trivially copyable / movable
    // For this reason we are applying the rule of zero

    /// @brief Creates a new random identifier in the RFC 4122 version 4 UUID text format.
    /// @return ServerId holding a lower case UUID, for example "3f2b6c1e-8d4a-4f0b-9a7e-1c2d3e4f5a6b".
    static ServerId generate();

    /// @brief Overloaded equality operator for comparing two ServerId objects.
    /// @param other The ServerId object to compare with.
    /// @return true if the ID strings of both objects are equal, false otherwise.
    bool operator==(const ServerId& other) const;

    /// @brief Overloaded not equal operator for comparing two ServerId objects.
    /// @param other The ServerId object to compare with.
    /// @return true if the ID strings of both objects are not equal, false otherwise.
    bool operator!=(const ServerId& other) const;

    /// @brief Lexicographical ordering, so ServerId can be used as a key of ordered containers.
    /// @param other The ServerId object to compare with.
    /// @return true if the text of this object sorts before the text of the other.
    bool operator<(const ServerId& other) const;

    /// @brief Returns the textual representation of the ID.
    const std::string& str() const noexcept;

    /// @brief Returns true if the ID holds no text.
    bool empty() const noexcept;

   private:
    /// internal representation of the ID, that was passed in constructor
    std::string id_{};
};

/// @brief Writes the textual representation of the ID to a stream.
std::ostream& operator<<(std::ostream& os, const ServerId& id);

}  // namespace serverstarter

namespace std {

template <>
struct hash<serverstarter::ServerId> {
    std::size_t operator()(const serverstarter::ServerId& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};

}  // namespace std

#endif  // SERVER_ID_HPP_INCLUDED
