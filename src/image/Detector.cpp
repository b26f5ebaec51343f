/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image/Detector.hpp"

#include <tuple>
#include <utility>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/variant/static_visitor.hpp>

#include "libirr/Error.hpp"
#include "image/normalization.hpp"
#include "image/path.hpp"
#include "image/regex.hpp"
#include "image/registry.hpp"
#include "image/validation.hpp"
#include "image/Utility.hpp"

namespace irr {
namespace image {

namespace {

const std::string imageKey{"image"};
const std::string globalKey{"global"};

bool looksLikeHost(const std::string& segment) {
    return segment.find_first_of(".:") != std::string::npos || segment == "localhost";
}

// Optional string field of an image map: absent and null read as empty,
// any other type is an authoring error
std::string getOptionalString(const Mapping& mapping, const std::string& key, ErrorKind kind, const Path& path) {
    const auto* value = mapping.find(key);
    if(value == nullptr || value->isNull()) {
        return "";
    }
    if(!value->isString()) {
        auto message = boost::format("Image map at '%s' has a non-string '%s' field") % path::toString(path) % key;
        IRR_THROW_IMAGE_ERROR(kind, message.str());
    }
    return value->getString();
}

void validateImageMapReference(const Reference& reference, const Path& path) {
    if(!validation::isValidRepositoryName(reference.repository)) {
        auto message = boost::format("Image map at '%s' has invalid repository '%s'")
            % path::toString(path) % reference.repository;
        IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidRepositoryName, message.str());
    }
    if(!reference.tag.empty() && !reference.digest.empty()) {
        auto message = boost::format("Image map at '%s' has both a tag and a digest") % path::toString(path);
        IRR_THROW_IMAGE_ERROR(ErrorKind::TagAndDigestPresent, message.str());
    }
    if(!reference.tag.empty() && !validation::isValidTag(reference.tag)) {
        auto message = boost::format("Image map at '%s' has invalid tag '%s'") % path::toString(path) % reference.tag;
        IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidTagFormat, message.str());
    }
    if(!reference.digest.empty() && !validation::isValidDigest(reference.digest)) {
        auto message = boost::format("Image map at '%s' has invalid digest '%s'") % path::toString(path) % reference.digest;
        IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidDigestFormat, message.str());
    }
}

/**
 * Splits what can safely be told about a templated reference string such as
 * "quay.io/org/app:{{ .Values.tag }}" or "{{ .Values.registry }}/app:1.0".
 *
 * Registry and repository are only filled in when the text before the first
 * template marker determines them. An empty registry means the registry is
 * decided by the template. Tag and digest are left to the template.
 */
Reference inferTemplatedReference(const std::string& value, const std::string& globalRegistry) {
    auto reference = Reference{};
    reference.original = value;

    auto prefix = value.substr(0, value.find("{{"));
    auto firstSlash = prefix.find('/');
    auto lastSlash = prefix.rfind('/');
    auto nameEnd = prefix.find_first_of(":@", lastSlash == std::string::npos ? 0 : lastSlash + 1);

    // the registry is implicit once a first segment that is not a host is known
    auto isRegistryImplicit = false;

    if(nameEnd != std::string::npos) {
        std::tie(reference.registry, reference.repository) = splitRegistryAndRepository(prefix.substr(0, nameEnd));
        isRegistryImplicit = reference.registry.empty();
    }
    else if(firstSlash != std::string::npos) {
        auto firstSegment = prefix.substr(0, firstSlash);
        if(looksLikeHost(firstSegment)) {
            reference.registry = firstSegment;
        }
        else {
            isRegistryImplicit = true;
        }
    }

    if(isRegistryImplicit) {
        reference.registry = globalRegistry;
    }
    if(!reference.registry.empty() || isRegistryImplicit) {
        reference.registry = normalizeRegistry(reference.registry);
    }
    reference.repository = normalizeRepository(reference.registry, reference.repository);

    return reference;
}

}

struct Detector::Traversal {
    std::string globalRegistry;
    DetectionResult result;
};

class Detector::NodeVisitor : public boost::static_visitor<> {
public:
    NodeVisitor(const Detector& detector, const Path& path, Traversal& traversal)
        : detector(detector)
        , path(path)
        , traversal(traversal)
    {}

    void operator()(const Null&) const {}
    void operator()(bool) const {}
    void operator()(std::int64_t) const {}
    void operator()(double) const {}

    void operator()(const std::string& value) const {
        detector.processString(value, path, traversal);
    }

    void operator()(const Sequence& sequence) const {
        detector.processSequence(sequence, path, traversal);
    }

    void operator()(const Mapping& mapping) const {
        detector.processMapping(mapping, path, traversal);
    }

private:
    const Detector& detector;
    const Path& path;
    Traversal& traversal;
};

std::string toString(Pattern pattern) {
    switch(pattern) {
        case Pattern::Map:    return "map";
        case Pattern::String: return "string";
        case Pattern::Global: return "global";
    }
    IRR_THROW_ERROR("failed to convert unknown image pattern to string");
}

std::string toString(UnsupportedType type) {
    switch(type) {
        case UnsupportedType::MalformedMap:      return "malformed-map";
        case UnsupportedType::MalformedString:   return "malformed-string";
        case UnsupportedType::AmbiguousPath:     return "ambiguous-path";
        case UnsupportedType::NonSourceRegistry: return "non-source-registry";
    }
    IRR_THROW_ERROR("failed to convert unknown unsupported image type to string");
}

Detector::Detector(DetectionContext context)
    : context(std::move(context))
    , parser{this->context.strict}
{}

DetectionResult Detector::detect(const Value& values) const {
    auto traversal = Traversal{context.globalRegistry, DetectionResult{}};

    if(values.isMapping()) {
        seedGlobalRegistry(values.getMapping(), traversal);
    }

    processValue(values, Path{}, traversal);

    traversal.result.globalRegistry = traversal.globalRegistry;

    auto message = boost::format("Detected %d image(s), %d unsupported")
        % traversal.result.detected.size()
        % traversal.result.unsupported.size();
    utility::printLog(message, libirr::LogLevel::DEBUG);

    return std::move(traversal.result);
}

void Detector::seedGlobalRegistry(const Mapping& root, Traversal& traversal) const {
    const auto* global = root.find(globalKey);
    if(global == nullptr || !global->isMapping()) {
        return;
    }

    for(const auto& entry : global->getMapping()) {
        if(boost::algorithm::icontains(entry.first, "registry")
           && entry.second.isString()
           && !entry.second.getString().empty()) {
            traversal.globalRegistry = entry.second.getString();
            auto message = boost::format("Using global registry '%s' from %s.%s")
                % traversal.globalRegistry % globalKey % entry.first;
            utility::printLog(message, libirr::LogLevel::INFO);
            return;
        }
    }
}

void Detector::processValue(const Value& value, const Path& path, Traversal& traversal) const {
    auto visitor = NodeVisitor{*this, path, traversal};
    value.apply(visitor);
}

void Detector::processMapping(const Mapping& mapping, const Path& path, Traversal& traversal) const {
    // an "image" string takes precedence over the map's own fields
    auto isImageKeyDetected = false;
    const auto* image = mapping.find(imageKey);
    if(image != nullptr && image->isString()) {
        isImageKeyDetected = processString(image->getString(), path::appendKey(path, imageKey), traversal);
    }

    if(!isImageKeyDetected && processImageMap(mapping, path, traversal)) {
        return;
    }

    for(const auto& entry : mapping) {
        const auto& key = entry.first;
        const auto& value = entry.second;

        if(key == imageKey && value.isString()) {
            continue;
        }
        if(path.empty() && key == globalKey && value.isMapping()) {
            continue;
        }

        auto childPath = path::appendKey(path, key);
        try {
            processValue(value, childPath, traversal);
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to detect images at '%s'") % path::toString(childPath);
            IRR_RETHROW_ERROR(e, message.str());
        }
    }
}

void Detector::processSequence(const Sequence& sequence, const Path& path, Traversal& traversal) const {
    for(std::size_t i=0; i<sequence.size(); ++i) {
        processValue(sequence[i], path::appendIndex(path, i), traversal);
    }
}

/**
 * Returns true when the string parsed into a valid reference, whether or
 * not it was recorded as detected.
 */
bool Detector::processString(const std::string& value, const Path& path, Traversal& traversal) const {
    if(path::isNonImagePath(path)) {
        return false;
    }

    auto isKnownImagePath = path::isImagePath(path);

    if(utility::containsTemplate(value)) {
        return processTemplatedString(value, path, isKnownImagePath, traversal);
    }

    if(!isKnownImagePath && !regex::isTagOrDigestShaped(value)) {
        return false;
    }

    auto reference = Reference{};
    try {
        reference = parser.split(value);
        if(reference.registry.empty()) {
            reference.registry = traversal.globalRegistry;
        }
        normalize(reference);
    }
    catch(ImageError& e) {
        if(!context.strict) {
            auto message = boost::format("Ignoring unparsable image candidate '%s' at '%s': %s")
                % value % path::toString(path) % e.what();
            utility::printLog(message, libirr::LogLevel::DEBUG);
            return false;
        }
        if(!isKnownImagePath) {
            auto message = boost::format("Image-like string at unrecognized path '%s'") % path::toString(path);
            IRR_WRAP_IMAGE_ERROR(e, ErrorKind::AmbiguousStringPath, message.str());
        }
        recordUnsupported(path, UnsupportedType::MalformedString, e, traversal);
        return false;
    }

    if(!isInScope(reference)) {
        if(context.strict) {
            auto message = boost::format("Image '%s' at '%s' is not hosted on a source registry")
                % value % path::toString(path);
            recordUnsupported(path, UnsupportedType::NonSourceRegistry,
                              IRR_IMAGE_ERROR(ErrorKind::NonSourceRegistry, message.str()), traversal);
        }
        return true;
    }

    if(context.strict && !isKnownImagePath) {
        auto message = boost::format("Image '%s' found at unrecognized path '%s'") % value % path::toString(path);
        recordUnsupported(path, UnsupportedType::AmbiguousPath,
                          IRR_IMAGE_ERROR(ErrorKind::AmbiguousStringPath, message.str()), traversal);
        return true;
    }

    recordDetected(std::move(reference), path, Pattern::String, Value{value}, traversal);
    return true;
}

bool Detector::processTemplatedString(const std::string& value, const Path& path, bool isKnownImagePath,
                                      Traversal& traversal) const {
    if(!isKnownImagePath) {
        return false;
    }

    if(!context.templateMode) {
        auto message = boost::format("Template variable in image '%s' at '%s'") % value % path::toString(path);
        if(context.strict) {
            recordUnsupported(path, UnsupportedType::MalformedString,
                              IRR_IMAGE_ERROR(ErrorKind::TemplateVariableDetected, message.str()), traversal);
        }
        else {
            utility::printLog(message, libirr::LogLevel::DEBUG);
        }
        return false;
    }

    auto reference = inferTemplatedReference(value, traversal.globalRegistry);

    // a registry set by the template itself cannot be checked
    if(!reference.registry.empty() && !isInScope(reference)) {
        if(context.strict) {
            auto message = boost::format("Templated image '%s' at '%s' is not hosted on a source registry")
                % value % path::toString(path);
            recordUnsupported(path, UnsupportedType::NonSourceRegistry,
                              IRR_IMAGE_ERROR(ErrorKind::NonSourceRegistry, message.str()), traversal);
        }
        return true;
    }

    recordDetected(std::move(reference), path, Pattern::String, Value{value}, traversal);
    return true;
}

/**
 * Returns true when the mapping is an image map, in which case its fields
 * must not be inspected any further.
 */
bool Detector::processImageMap(const Mapping& mapping, const Path& path, Traversal& traversal) const {
    const auto* repositoryValue = mapping.find("repository");
    if(repositoryValue == nullptr || repositoryValue->isNull()) {
        return false;
    }
    if(!repositoryValue->isString()) {
        auto message = boost::format("Image map at '%s' has a non-string 'repository' field") % path::toString(path);
        IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidImageMapRepo, message.str());
    }

    const auto& repository = repositoryValue->getString();
    if(utility::isSourceControlURL(repository)) {
        auto message = boost::format("Skipping source control repository '%s' at '%s'") % repository % path::toString(path);
        utility::printLog(message, libirr::LogLevel::DEBUG);
        return false;
    }

    auto reference = Reference{};
    reference.path = path;
    reference.repository = repository;
    reference.registry = getOptionalString(mapping, "registry", ErrorKind::InvalidImageMapRegistryType, path);
    reference.tag = getOptionalString(mapping, "tag", ErrorKind::InvalidImageMapTagType, path);
    reference.digest = getOptionalString(mapping, "digest", ErrorKind::InvalidImageMapDigestType, path);

    if(utility::containsTemplate(reference.registry)
       || utility::containsTemplate(reference.repository)
       || utility::containsTemplate(reference.tag)
       || utility::containsTemplate(reference.digest)) {
        processTemplatedImageMap(mapping, path, std::move(reference), traversal);
        return true;
    }

    if(boost::algorithm::trim_copy(repository).empty()) {
        if(context.strict) {
            auto message = boost::format("Image map at '%s' has an empty repository") % path::toString(path);
            recordUnsupported(path, UnsupportedType::MalformedMap,
                              IRR_IMAGE_ERROR(ErrorKind::EmptyReference, message.str()), traversal);
        }
        return true;
    }

    // registry precedence: map field, then a registry embedded in the
    // repository, then the global override, then the default registry
    auto pattern = Pattern::Map;
    if(reference.registry.empty()) {
        std::tie(reference.registry, reference.repository) = splitRegistryAndRepository(repository);
        if(reference.registry.empty() && !traversal.globalRegistry.empty()) {
            reference.registry = traversal.globalRegistry;
            pattern = Pattern::Global;
        }
    }

    validateImageMapReference(reference, path);
    reference.detected = true;
    normalize(reference);

    if(!isInScope(reference)) {
        if(context.strict) {
            auto message = boost::format("Image map '%s' at '%s' is not hosted on a source registry")
                % reference.original % path::toString(path);
            recordUnsupported(path, UnsupportedType::NonSourceRegistry,
                              IRR_IMAGE_ERROR(ErrorKind::NonSourceRegistry, message.str()), traversal);
        }
        return true;
    }

    recordDetected(std::move(reference), path, pattern, Value{mapping}, traversal);
    return true;
}

void Detector::processTemplatedImageMap(const Mapping& mapping, const Path& path, Reference reference,
                                        Traversal& traversal) const {
    auto original = reference.registry.empty() ? reference.repository
                                               : reference.registry + "/" + reference.repository;
    if(!reference.tag.empty()) {
        original += ":" + reference.tag;
    }
    if(!reference.digest.empty()) {
        original += "@" + reference.digest;
    }

    if(!context.templateMode) {
        auto message = boost::format("Template variable in image map '%s' at '%s'") % original % path::toString(path);
        if(context.strict) {
            recordUnsupported(path, UnsupportedType::MalformedMap,
                              IRR_IMAGE_ERROR(ErrorKind::TemplateVariableDetected, message.str()), traversal);
        }
        else {
            utility::printLog(message, libirr::LogLevel::DEBUG);
        }
        return;
    }

    // keep only the fields the templates leave untouched
    auto pattern = Pattern::Map;
    if(utility::containsTemplate(reference.registry)) {
        reference.registry.clear();
    }
    else if(reference.registry.empty() && !utility::containsTemplate(reference.repository)) {
        std::tie(reference.registry, reference.repository) = splitRegistryAndRepository(reference.repository);
        if(reference.registry.empty()) {
            reference.registry = normalizeRegistry(traversal.globalRegistry);
            pattern = traversal.globalRegistry.empty() ? Pattern::Map : Pattern::Global;
        }
    }
    if(utility::containsTemplate(reference.repository)) {
        reference.repository.clear();
    }
    if(utility::containsTemplate(reference.tag)) {
        reference.tag.clear();
    }
    if(utility::containsTemplate(reference.digest)) {
        reference.digest.clear();
    }
    if(!reference.registry.empty()) {
        reference.registry = normalizeRegistry(reference.registry);
    }
    reference.repository = normalizeRepository(reference.registry, reference.repository);
    reference.original = original;

    if(!reference.registry.empty() && !isInScope(reference)) {
        if(context.strict) {
            auto message = boost::format("Templated image map '%s' at '%s' is not hosted on a source registry")
                % original % path::toString(path);
            recordUnsupported(path, UnsupportedType::NonSourceRegistry,
                              IRR_IMAGE_ERROR(ErrorKind::NonSourceRegistry, message.str()), traversal);
        }
        return;
    }

    recordDetected(std::move(reference), path, pattern, Value{mapping}, traversal);
}

bool Detector::isInScope(const Reference& reference) const {
    return isSourceRegistry(&reference, context.sourceRegistries, context.excludeRegistries);
}

void Detector::recordDetected(Reference reference, const Path& path, Pattern pattern, const Value& original,
                              Traversal& traversal) const {
    reference.path = path;
    auto message = boost::format("Detected image %s at '%s' (%s)")
        % reference % path::toString(path) % toString(pattern);
    utility::printLog(message, libirr::LogLevel::DEBUG);
    traversal.result.detected.push_back(DetectedImage{std::move(reference), path, pattern, original});
}

void Detector::recordUnsupported(const Path& path, UnsupportedType type, const ImageError& cause,
                                 Traversal& traversal) const {
    auto message = boost::format("Unsupported image at '%s' (%s): %s")
        % path::toString(path) % toString(type) % cause.what();
    utility::printLog(message, libirr::LogLevel::DEBUG);
    traversal.result.unsupported.push_back(UnsupportedImage{path, type, cause});
}

DetectionResult detectImages(const Value& values, const DetectionContext& context) {
    return Detector{context}.detect(values);
}

}
}
