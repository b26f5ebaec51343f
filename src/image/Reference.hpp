/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_Reference_hpp
#define irr_image_Reference_hpp

#include <string>
#include <vector>
#include <ostream>


namespace irr {
namespace image {

// Location of a node in a value tree: map keys and "[n]" sequence indices
using Path = std::vector<std::string>;

/**
 * Structured form of a container image reference such as
 * "quay.io/org/app:1.2" or "nginx@sha256:...".
 *
 * 'original' keeps the text the reference was parsed from. 'detected' is
 * set when the strict distribution grammar accepted the text, as opposed to
 * the lenient fallback parser.
 */
struct Reference {
    std::string registry;
    std::string repository;
    std::string tag;
    std::string digest;
    std::string original;
    bool detected = false;
    Path path;

    std::string getFullName() const;
    std::string string() const;

    static const std::string DEFAULT_REGISTRY;
    static const std::string LIBRARY_NAMESPACE;
    static const std::string DEFAULT_TAG;
};

bool operator==(const Reference&, const Reference&);
bool operator!=(const Reference&, const Reference&);

std::ostream& operator<<(std::ostream&, const Reference&);

}
}

#endif
