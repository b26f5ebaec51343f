/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageError.hpp"

#include <algorithm>


namespace irr {
namespace image {

std::string toString(ErrorKind kind) {
    switch(kind) {
        case ErrorKind::EmptyReference:              return "EmptyReference";
        case ErrorKind::InvalidImageReference:       return "InvalidImageReference";
        case ErrorKind::InvalidRepositoryName:       return "InvalidRepositoryName";
        case ErrorKind::InvalidTagFormat:            return "InvalidTagFormat";
        case ErrorKind::InvalidDigestFormat:         return "InvalidDigestFormat";
        case ErrorKind::InvalidRegistryName:         return "InvalidRegistryName";
        case ErrorKind::TagAndDigestPresent:         return "TagAndDigestPresent";
        case ErrorKind::InvalidImageMapRepo:         return "InvalidImageMapRepo";
        case ErrorKind::InvalidImageMapRegistryType: return "InvalidImageMapRegistryType";
        case ErrorKind::InvalidImageMapTagType:      return "InvalidImageMapTagType";
        case ErrorKind::InvalidImageMapDigestType:   return "InvalidImageMapDigestType";
        case ErrorKind::AmbiguousStringPath:         return "AmbiguousStringPath";
        case ErrorKind::TemplateVariableDetected:    return "TemplateVariableDetected";
        case ErrorKind::NonSourceRegistry:           return "NonSourceRegistry";
        case ErrorKind::PathNotFound:                return "PathNotFound";
    }
    IRR_THROW_ERROR("failed to convert unknown image error kind to string");
}

bool ImageError::is(ErrorKind kind) const {
    return std::find(kinds.cbegin(), kinds.cend(), kind) != kinds.cend();
}

void ImageError::wrap(ErrorKind kind, const ErrorTraceEntry& entry) {
    kinds.push_back(kind);
    appendErrorTraceEntry(entry);
}

}
}
