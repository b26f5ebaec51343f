/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_normalization_hpp
#define irr_image_normalization_hpp

#include <string>

#include "image/Reference.hpp"

namespace irr {
namespace image {

std::string normalizeRegistry(const std::string& registry);
std::string normalizeRepository(const std::string& registry, const std::string& repository);
void normalize(Reference& reference);

}
}

#endif
