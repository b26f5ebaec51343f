/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_registry_hpp
#define irr_image_registry_hpp

#include <string>
#include <vector>

#include "image/Reference.hpp"

namespace irr {
namespace image {

bool isSourceRegistry(const Reference* reference,
                      const std::vector<std::string>& sourceRegistries,
                      const std::vector<std::string>& excludeRegistries);

std::string sanitizeRegistryForPath(const std::string& registry);

}
}

#endif
