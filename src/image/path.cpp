/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image/path.hpp"

#include <algorithm>
#include <vector>

#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

namespace irr {
namespace image {
namespace path {

namespace {

const boost::regex indexStep{"^\\[([0-9]{1,18})\\]$"};

// Fields known to hold image references
const std::vector<boost::regex> imagePathPatterns = {
    boost::regex{"^image$"},
    boost::regex{"(^|\\.)[A-Za-z0-9_-]*[Ii]mage$"},
    boost::regex{"(^|\\.)images\\[\\d+\\]$"},
    boost::regex{"(^|\\.)(containers|initContainers|ephemeralContainers)\\[\\d+\\]\\.image$"}
};

// Fields that never hold a full image reference, even when their value
// happens to look like one. These win over the image patterns.
const std::vector<boost::regex> nonImagePathPatterns = {
    boost::regex{"(^|\\.)enabled$"},
    boost::regex{"(^|\\.)annotations\\."},
    boost::regex{"(^|\\.)labels\\."},
    boost::regex{"(^|\\.)port$"},
    boost::regex{"(^|\\.)ports(\\.|\\[)"},
    boost::regex{"(^|\\.)timeout$"},
    boost::regex{"(^|\\.)serviceAccountName$"},
    boost::regex{"(^|\\.)replicas$"},
    boost::regex{"(^|\\.)resources\\."},
    boost::regex{"(^|\\.)env(\\.|\\[)"},
    boost::regex{"(^|\\.)command\\[\\d+\\]$"},
    boost::regex{"(^|\\.)args\\[\\d+\\]$"},
    boost::regex{"\\]\\.name$"},
    boost::regex{"(^|\\.)(tag|registry|repository|digest|pullPolicy)$"}
};

bool matchesAny(const std::vector<boost::regex>& patterns, const std::string& path) {
    return std::any_of(patterns.cbegin(), patterns.cend(), [&path](const boost::regex& pattern) {
        return boost::regex_search(path, pattern);
    });
}

}

Path appendKey(const Path& path, const std::string& key) {
    auto result = path;
    result.push_back(key);
    return result;
}

Path appendIndex(const Path& path, std::size_t index) {
    auto result = path;
    result.push_back("[" + std::to_string(index) + "]");
    return result;
}

bool parseIndexStep(const std::string& step, std::size_t& index) {
    auto matches = boost::smatch{};
    if(!boost::regex_match(step, matches, indexStep)) {
        return false;
    }
    index = boost::lexical_cast<std::size_t>(matches[1].str());
    return true;
}

std::string toString(const Path& path) {
    auto result = std::string{};
    for(const auto& step : path) {
        auto index = std::size_t{};
        if(!result.empty() && !parseIndexStep(step, index)) {
            result += ".";
        }
        result += step;
    }
    return result;
}

bool isImagePath(const Path& path) {
    auto rendered = toString(path);
    return !matchesAny(nonImagePathPatterns, rendered)
        && matchesAny(imagePathPatterns, rendered);
}

bool isNonImagePath(const Path& path) {
    return matchesAny(nonImagePathPatterns, toString(path));
}

}
}
}
