/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_json_hpp
#define irr_image_json_hpp

#include <rapidjson/document.h>

#include "image/Detector.hpp"
#include "image/Value.hpp"

/**
 * Conversions between RapidJSON documents and the types of the detector
 */

namespace irr {
namespace image {
namespace json {

Value toValue(const rapidjson::Value& json);
rapidjson::Value toJSON(const Value& value, rapidjson::MemoryPoolAllocator<>& allocator);
rapidjson::Document makeReport(const DetectionResult& result);

}
}
}

#endif
