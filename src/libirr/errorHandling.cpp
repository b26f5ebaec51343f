/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Error.hpp"

#include <ios>
#include <stdexcept>
#include <system_error>

#include <boost/lexical_cast/bad_lexical_cast.hpp>
#include <boost/regex/pattern_except.hpp>

namespace libirr {

std::string getExceptionTypeString(const std::exception& e) {
    if (dynamic_cast<const boost::regex_error*>(&e)) {
        return "regex error";
    }
    if (dynamic_cast<const boost::bad_lexical_cast*>(&e)) {
        return "bad lexical cast";
    }
    if (dynamic_cast<const std::ios_base::failure*>(&e)) {
        return "ios_base failure";
    }
    if (dynamic_cast<const std::system_error*>(&e)) {
        return "system error";
    }
    if (dynamic_cast<const std::logic_error*>(&e)) {
        return "logic error";
    }
    if (dynamic_cast<const std::runtime_error*>(&e)) {
        return "runtime error";
    }
    return "generic exception";
}

}
