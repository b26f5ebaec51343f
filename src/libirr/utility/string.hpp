/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libirr_utility_string_hpp
#define libirr_utility_string_hpp

#include <string>
#include <vector>

/**
 * Utility functions for string manipulation
 */

namespace libirr {
namespace string {

std::vector<std::string> parseList(const std::string& input, const char separator = ',');
bool isNumeric(const std::string&);

}}

#endif
