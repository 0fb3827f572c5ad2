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


#include <serverstarter/server_id.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>

namespace serverstarter {

ServerId::ServerId(std::string_view id) : id_(id) {
}

ServerId::ServerId(const char* id) : id_(id != nullptr ? std::string_view(id) : std::string_view("")) {
}

ServerId ServerId::generate() {
    // RULECHECKER_comment(1, 1, check_static_object_dynamic_initialization, "This is safe because the static is a function local.", true);
    static std::mutex generator_mutex;
    static boost::uuids::random_generator generator;

    boost::uuids::uuid uuid;
    {
        // random_generator is not thread-safe
        std::lock_guard<std::mutex> lock(generator_mutex);
        uuid = generator();
    }

    return ServerId{boost::uuids::to_string(uuid)};
}

bool ServerId::operator==(const ServerId& other) const {
    return id_ == other.id_;
}

bool ServerId::operator!=(const ServerId& other) const {
    return !operator==(other);
}

bool ServerId::operator<(const ServerId& other) const {
    return id_ < other.id_;
}

const std::string& ServerId::str() const noexcept {
    return id_;
}

bool ServerId::empty() const noexcept {
    return id_.empty();
}

std::ostream& operator<<(std::ostream& os, const ServerId& id) {
    os << id.str();
    return os;
}

}  // namespace serverstarter
