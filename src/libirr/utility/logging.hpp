/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libirr_utility_logging_hpp
#define libirr_utility_logging_hpp

#include <string>

#include <boost/format.hpp>

#include "libirr/Logger.hpp"

/**
 * Utility functions for output controls
 */

namespace libirr {

void logMessage(const std::string&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);
void logMessage(const boost::format&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);

}

#endif
