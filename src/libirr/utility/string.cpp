/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libirr/Error.hpp"
#include "libirr/utility/logging.hpp"

namespace libirr {
namespace string {

/**
 * Converts a separator-delimited list (e.g. "docker.io, quay.io") into its entries.
 *
 * Entries are trimmed of surrounding whitespace. An empty input yields an
 * empty list, while an empty entry in a non-empty input is an error.
 */
std::vector<std::string> parseList(const std::string& input, const char separator) {
    if(boost::algorithm::trim_copy(input).empty()) {
        return std::vector<std::string>{};
    }

    auto entries = std::vector<std::string>{};
    boost::split(entries, input, boost::is_any_of(std::string{separator}));

    for(auto& entry : entries) {
        boost::algorithm::trim(entry);
        if(entry.empty()) {
            auto message = boost::format("Error parsing '%s'. Found empty entry: expected a list of"
                                         " values separated by '%c'.") % input % separator;
            logMessage(message, LogLevel::GENERAL, std::cerr);
            IRR_THROW_ERROR(message.str(), LogLevel::INFO);
        }
    }

    return entries;
}

bool isNumeric(const std::string& s) {
    return !s.empty() && std::all_of(s.cbegin(), s.cend(), [](unsigned char c) {
        return std::isdigit(c);
    });
}

}}
