/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_ImageError_hpp
#define irr_image_ImageError_hpp

#include <string>
#include <vector>

#include "libirr/Error.hpp"


namespace irr {
namespace image {

enum class ErrorKind {
    EmptyReference,
    InvalidImageReference,
    InvalidRepositoryName,
    InvalidTagFormat,
    InvalidDigestFormat,
    InvalidRegistryName,
    TagAndDigestPresent,
    InvalidImageMapRepo,
    InvalidImageMapRegistryType,
    InvalidImageMapTagType,
    InvalidImageMapDigestType,
    AmbiguousStringPath,
    TemplateVariableDetected,
    NonSourceRegistry,
    PathNotFound
};

std::string toString(ErrorKind);

/**
 * Error raised while parsing or detecting image references.
 *
 * On top of the error trace of libirr::Error it carries a chain of kinds:
 * the kind the error originated with, followed by the kinds flagged when the
 * error was wrapped further up (e.g. AmbiguousStringPath). Callers match on
 * kinds, never on messages.
 */
class ImageError : public libirr::Error {
public:
    ImageError(ErrorKind kind, const ErrorTraceEntry& entry, libirr::LogLevel logLevel = libirr::LogLevel::ERROR)
        : libirr::Error{logLevel, entry}
        , kinds{kind}
    {}

    ErrorKind getKind() const {
        return kinds.front();
    }

    bool is(ErrorKind kind) const;
    void wrap(ErrorKind kind, const ErrorTraceEntry& entry);

    const std::vector<ErrorKind>& getKinds() const {
        return kinds;
    }

private:
    std::vector<ErrorKind> kinds;
};

}
}

#define IRR_IMAGE_ERROR(kind, errorMessage) \
    irr::image::ImageError{kind, IRR_MAKE_ERROR_TRACE_ENTRY(errorMessage)}

#define IRR_THROW_IMAGE_ERROR(kind, errorMessage) { \
    throw IRR_IMAGE_ERROR(kind, errorMessage); \
}

#define IRR_WRAP_IMAGE_ERROR(error, kind, errorMessage) \
    (error).wrap(kind, IRR_MAKE_ERROR_TRACE_ENTRY(errorMessage))

#endif
