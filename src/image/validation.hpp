/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_validation_hpp
#define irr_image_validation_hpp

#include <string>

/**
 * Syntax checks for the components of an image reference.
 * The parser, the normalizer and the detector share these predicates.
 */

namespace irr {
namespace image {
namespace validation {

bool isValidRegistryName(const std::string&);
bool isValidRepositoryName(const std::string&);
bool isValidTag(const std::string&);
bool isValidDigest(const std::string&);

}
}
}

#endif
