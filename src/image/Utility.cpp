/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Utility.hpp"

#include <boost/algorithm/string/predicate.hpp>


namespace irr {
namespace image {
namespace utility {

// Go/Helm template actions, e.g. "{{ .Values.image.tag }}"
bool containsTemplate(const std::string& s) {
    return s.find("{{") != std::string::npos
        && s.find("}}") != std::string::npos;
}

// Chart values often carry git repositories under a "repository" key
bool isSourceControlURL(const std::string& s) {
    return boost::starts_with(s, "http")
        || boost::starts_with(s, "git@")
        || boost::ends_with(s, ".git")
        || boost::contains(s, "github.com");
}

void printLog(const boost::format& message, libirr::LogLevel level,
              std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), level, outStream, errStream);
}

void printLog(const std::string& message, libirr::LogLevel level,
              std::ostream& outStream, std::ostream& errStream) {
    libirr::Logger::getInstance().log(message, "ImageDetection", level, outStream, errStream);
}

}
}
}
