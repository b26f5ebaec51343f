/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef irr_image_regex_hpp
#define irr_image_regex_hpp

#include <string>

#include <boost/optional.hpp>
#include <boost/regex.hpp>

namespace irr {
namespace image {
namespace regex {

// Compiled pieces of the distribution reference grammar
extern const boost::regex domain;
extern const boost::regex name;
extern const boost::regex tag;
extern const boost::regex digest;
extern const boost::regex reference;

// Components captured by a full match of the 'reference' expression.
// Tag and digest are empty when the text does not carry them.
struct ReferenceMatch {
    std::string name;
    std::string tag;
    std::string digest;
};

boost::optional<ReferenceMatch> matchReference(const std::string& input);
bool isTagOrDigestShaped(const std::string& input);

}
}
}

#endif
