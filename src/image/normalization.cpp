/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image/normalization.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "libirr/utility/string.hpp"
#include "image/Utility.hpp"

namespace irr {
namespace image {

/**
 * Reduces a registry name to the token used for comparisons and output.
 *
 * The name is trimmed and lower-cased, anything after the host (a path or a
 * trailing slash) is dropped, a numeric port is stripped, and the aliases of
 * Docker Hub collapse to the default registry. An empty name stands for the
 * default registry.
 */
std::string normalizeRegistry(const std::string& registry) {
    auto normalized = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(registry));

    auto slash = normalized.find('/');
    if(slash != std::string::npos) {
        normalized.erase(slash);
    }

    auto colon = normalized.rfind(':');
    if(colon != std::string::npos && libirr::string::isNumeric(normalized.substr(colon + 1))) {
        normalized.erase(colon);
    }

    if(normalized.empty()
       || normalized == Reference::DEFAULT_REGISTRY
       || normalized == "index." + Reference::DEFAULT_REGISTRY) {
        return Reference::DEFAULT_REGISTRY;
    }

    return normalized;
}

// Official images of the default registry live in the "library" namespace
std::string normalizeRepository(const std::string& registry, const std::string& repository) {
    if(registry == Reference::DEFAULT_REGISTRY
       && !repository.empty()
       && repository.find('/') == std::string::npos) {
        return Reference::LIBRARY_NAMESPACE + "/" + repository;
    }
    return repository;
}

/**
 * Applies the defaults in place: default registry, canonical registry token,
 * default tag when neither tag nor digest is set, and the "library" namespace
 * for single-component repositories of the default registry. The original
 * text is reconstructed when the reference was not parsed from one.
 *
 * Normalizing an already normalized reference leaves it unchanged.
 */
void normalize(Reference& reference) {
    reference.registry = normalizeRegistry(reference.registry);

    if(reference.tag.empty() && reference.digest.empty()) {
        reference.tag = Reference::DEFAULT_TAG;
    }

    reference.repository = normalizeRepository(reference.registry, reference.repository);

    if(reference.original.empty()) {
        reference.original = reference.string();
    }

    utility::printLog(boost::format("Normalized image reference: %s") % reference, libirr::LogLevel::DEBUG);
}

}
}
