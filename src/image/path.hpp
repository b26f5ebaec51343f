/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_path_hpp
#define irr_image_path_hpp

#include <cstddef>
#include <string>

#include "image/Reference.hpp"

/**
 * Helpers for value tree paths and the heuristics telling whether a path
 * is expected to hold an image reference.
 *
 * A path is rendered with '.' between keys and index steps appended as
 * they are, e.g. "spec.template.spec.containers[0].image".
 */

namespace irr {
namespace image {
namespace path {

Path appendKey(const Path& path, const std::string& key);
Path appendIndex(const Path& path, std::size_t index);
bool parseIndexStep(const std::string& step, std::size_t& index);
std::string toString(const Path& path);

bool isImagePath(const Path& path);
bool isNonImagePath(const Path& path);

}
}
}

#endif
