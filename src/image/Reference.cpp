/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Reference.hpp"

#include <sstream>


namespace irr {
namespace image {

const std::string Reference::DEFAULT_REGISTRY{"docker.io"};
const std::string Reference::LIBRARY_NAMESPACE{"library"};
const std::string Reference::DEFAULT_TAG{"latest"};

std::string Reference::getFullName() const {
    if(registry.empty()) {
        return repository;
    }
    return registry + "/" + repository;
}

/**
 * Serializes the reference as registry/repository followed by either
 * "@digest" or ":tag". The digest wins over the tag, although a
 * normalized reference never carries both.
 */
std::string Reference::string() const {
    auto output = std::stringstream{};
    output << getFullName();
    if(!digest.empty()) {
        output << "@" << digest;
    }
    else if(!tag.empty()) {
        output << ":" << tag;
    }
    return output.str();
}

// Two references are equal when they name the same image, regardless of
// where and from which text they were parsed
bool operator==(const Reference& lhs, const Reference& rhs) {
    return lhs.registry == rhs.registry
        && lhs.repository == rhs.repository
        && lhs.tag == rhs.tag
        && lhs.digest == rhs.digest;
}

bool operator!=(const Reference& lhs, const Reference& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Reference& reference) {
    os << reference.string();
    return os;
}

}
}
