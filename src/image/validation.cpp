/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image/validation.hpp"

#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>

#include "libirr/utility/string.hpp"


namespace irr {
namespace image {
namespace validation {

namespace {

const boost::regex domainLabel{"^[A-Za-z0-9-]+$"};
const boost::regex hostname{"^[A-Za-z0-9-]+(?:\\.[A-Za-z0-9-]+)*$"};
const boost::regex repositoryComponent{"^[a-z0-9]+(?:[._-][a-z0-9]+)*$"};
const boost::regex tag{"^[A-Za-z0-9_][A-Za-z0-9_.-]*$"};
const boost::regex digest{"^sha256:[0-9a-fA-F]{64}$"};

const std::string localhost{"localhost"};

const std::size_t maxRepositoryLength = 255;
const std::size_t maxRepositoryComponents = 5;
const std::size_t maxTagLength = 128;

}

/**
 * Accepts "localhost", a "host:port" pair with a numeric port, or a plain
 * domain made of two or three dot-separated labels (e.g. "docker.io",
 * "registry.example.com"). A single label without port, such as "myregistry",
 * cannot be told apart from a repository namespace and is rejected.
 */
bool isValidRegistryName(const std::string& registry) {
    if(registry == localhost) {
        return true;
    }

    auto colon = registry.rfind(':');
    if(colon != std::string::npos) {
        auto host = registry.substr(0, colon);
        auto port = registry.substr(colon + 1);
        return libirr::string::isNumeric(port)
            && (host == localhost || boost::regex_match(host, hostname));
    }

    auto labels = std::vector<std::string>{};
    boost::split(labels, registry, boost::is_any_of("."));
    if(labels.size() < 2 || labels.size() > 3) {
        return false;
    }
    for(const auto& label : labels) {
        if(!boost::regex_match(label, domainLabel)) {
            return false;
        }
    }
    return true;
}

bool isValidRepositoryName(const std::string& repository) {
    if(repository.empty() || repository.size() > maxRepositoryLength) {
        return false;
    }

    auto components = std::vector<std::string>{};
    boost::split(components, repository, boost::is_any_of("/"));
    if(components.size() > maxRepositoryComponents) {
        return false;
    }

    // the component expression only admits single separators between
    // lowercase alphanumeric runs, which rules out "..", "--" and upper case
    for(const auto& component : components) {
        if(!boost::regex_match(component, repositoryComponent)) {
            return false;
        }
    }
    return true;
}

bool isValidTag(const std::string& value) {
    return !value.empty()
        && value.size() <= maxTagLength
        && boost::regex_match(value, tag);
}

bool isValidDigest(const std::string& value) {
    return boost::regex_match(value, digest);
}

}
}
}
