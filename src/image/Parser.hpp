/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_Parser_hpp
#define irr_image_Parser_hpp

#include <string>
#include <utility>

#include "image/Reference.hpp"

namespace irr {
namespace image {

/**
 * Parses image references.
 *
 * The distribution grammar is tried first. When it rejects the input and the
 * parser is lenient, a heuristic parser takes over, splitting the digest
 * on the last '@', the tag on the last ':' past the first '/', and the
 * registry off the first segment when it looks like a host.
 * Failures are reported as image::ImageError with the kind of the check that
 * failed.
 */
class Parser {
public:
    explicit Parser(bool strict = false);

    // Components as written (no defaults applied)
    Reference split(const std::string& input) const;

    // Components with the normalization defaults applied
    Reference parse(const std::string& input) const;

private:
    Reference parseWithGrammar(const std::string& input) const;
    Reference parseWithHeuristics(const std::string& input) const;

private:
    bool strict;
};

Reference parseImageReference(const std::string& input, bool strict = false);

// Splits "host/namespace/name" into registry and repository. The first
// segment names a registry only when it looks like a host (contains '.' or
// ':', or is "localhost"), otherwise the registry is left empty.
std::pair<std::string, std::string> splitRegistryAndRepository(const std::string& name);

}
}

#endif
