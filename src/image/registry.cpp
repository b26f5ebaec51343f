/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image/registry.hpp"

#include <algorithm>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "image/normalization.hpp"
#include "image/Utility.hpp"

namespace irr {
namespace image {

namespace {

bool containsRegistry(const std::vector<std::string>& registries, const std::string& normalizedRegistry) {
    return std::any_of(registries.cbegin(), registries.cend(), [&normalizedRegistry](const std::string& entry) {
        return normalizeRegistry(entry) == normalizedRegistry;
    });
}

}

/**
 * Tells whether the registry of the reference is in scope for rewriting.
 *
 * Both the reference registry and the list entries are compared in their
 * normalized form, so "index.docker.io" and "DOCKER.IO" match "docker.io".
 * Exclusions take precedence over sources.
 */
bool isSourceRegistry(const Reference* reference,
                      const std::vector<std::string>& sourceRegistries,
                      const std::vector<std::string>& excludeRegistries) {
    if(reference == nullptr) {
        return false;
    }

    auto registry = normalizeRegistry(reference->registry);

    if(containsRegistry(excludeRegistries, registry)) {
        auto message = boost::format("Registry %s of image %s is excluded") % registry % reference->original;
        utility::printLog(message, libirr::LogLevel::DEBUG);
        return false;
    }

    return containsRegistry(sourceRegistries, registry);
}

/**
 * Turns a registry name into a token usable as a path component, e.g. as a
 * repository prefix when images are relocated: "quay.io" -> "quayio",
 * "registry.example.com:5000" -> "registryexamplecom". All Docker Hub
 * aliases map to "dockerio".
 */
std::string sanitizeRegistryForPath(const std::string& registry) {
    auto sanitized = normalizeRegistry(registry);
    boost::algorithm::erase_all(sanitized, ".");
    return sanitized;
}

}
}
