/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_Utility_hpp
#define irr_image_Utility_hpp

#include <iostream>
#include <string>

#include <boost/format.hpp>

#include "libirr/Logger.hpp"

namespace irr {
namespace image {
namespace utility {

bool containsTemplate(const std::string&);
bool isSourceControlURL(const std::string&);

void printLog(const boost::format& message, libirr::LogLevel LogLevel,
              std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);
void printLog(const std::string& message, libirr::LogLevel LogLevel,
              std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif
