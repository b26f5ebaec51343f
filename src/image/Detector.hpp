/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_Detector_hpp
#define irr_image_Detector_hpp

#include <string>
#include <vector>

#include "image/ImageError.hpp"
#include "image/Parser.hpp"
#include "image/Reference.hpp"
#include "image/Value.hpp"

namespace irr {
namespace image {

struct DetectionContext {
    std::vector<std::string> sourceRegistries;
    std::vector<std::string> excludeRegistries;
    std::string globalRegistry;
    bool strict = false;
    bool templateMode = false;
};

// How a detected image is expressed in the values
enum class Pattern {
    Map,        // {registry, repository, tag, digest} fields
    String,     // a single reference string
    Global      // fields whose registry comes from the global override
};

std::string toString(Pattern);

struct DetectedImage {
    Reference reference;
    Path path;
    Pattern pattern;
    Value original;
};

enum class UnsupportedType {
    MalformedMap,
    MalformedString,
    AmbiguousPath,
    NonSourceRegistry
};

std::string toString(UnsupportedType);

struct UnsupportedImage {
    Path path;
    UnsupportedType type;
    ImageError cause;
};

struct DetectionResult {
    std::vector<DetectedImage> detected;
    std::vector<UnsupportedImage> unsupported;
    // global registry in effect after the root of the values was inspected
    std::string globalRegistry;
};

/**
 * Finds image references in a tree of values.
 *
 * Images are recognized either as single strings, at paths known to hold
 * images or when the string alone reads as a tagged reference, or as maps
 * with a "repository" field and optional "registry", "tag" and "digest"
 * fields. Only images whose registry is a source registry are reported as
 * detected. In strict mode every candidate that is not confidently detected
 * is reported as unsupported, in lenient mode it is dropped.
 *
 * A "global" map at the root whose keys mention "registry" provides the
 * registry for images that do not name one.
 *
 * Malformed image maps (e.g. a non-string repository) abort the detection
 * with an ImageError.
 */
class Detector {
public:
    explicit Detector(DetectionContext context);

    DetectionResult detect(const Value& values) const;

    const DetectionContext& getContext() const {
        return context;
    }

private:
    struct Traversal;
    class NodeVisitor;

    void seedGlobalRegistry(const Mapping& root, Traversal& traversal) const;
    void processValue(const Value& value, const Path& path, Traversal& traversal) const;
    void processMapping(const Mapping& mapping, const Path& path, Traversal& traversal) const;
    void processSequence(const Sequence& sequence, const Path& path, Traversal& traversal) const;
    bool processString(const std::string& value, const Path& path, Traversal& traversal) const;
    bool processTemplatedString(const std::string& value, const Path& path, bool isKnownImagePath,
                                Traversal& traversal) const;
    bool processImageMap(const Mapping& mapping, const Path& path, Traversal& traversal) const;
    void processTemplatedImageMap(const Mapping& mapping, const Path& path, Reference reference,
                                  Traversal& traversal) const;

    bool isInScope(const Reference& reference) const;
    void recordDetected(Reference reference, const Path& path, Pattern pattern, const Value& original,
                        Traversal& traversal) const;
    void recordUnsupported(const Path& path, UnsupportedType type, const ImageError& cause,
                           Traversal& traversal) const;

private:
    DetectionContext context;
    Parser parser;
};

DetectionResult detectImages(const Value& values, const DetectionContext& context);

}
}

#endif
