/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image/Parser.hpp"

#include <tuple>
#include <utility>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "image/ImageError.hpp"
#include "image/normalization.hpp"
#include "image/regex.hpp"
#include "image/validation.hpp"
#include "image/Utility.hpp"

namespace irr {
namespace image {

namespace {

const char* const doubledSeparators[] = {"::", "///", "@@"};
const std::string disallowedCharacters{" \t\r\n$?#\\"};

void checkTagAndDigest(const Reference& reference, const std::string& input) {
    if(!reference.digest.empty() && !validation::isValidDigest(reference.digest)) {
        auto message = boost::format("Invalid digest '%s' in image reference '%s'") % reference.digest % input;
        IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidDigestFormat, message.str());
    }
    if(!reference.tag.empty() && !validation::isValidTag(reference.tag)) {
        auto message = boost::format("Invalid tag '%s' in image reference '%s'") % reference.tag % input;
        IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidTagFormat, message.str());
    }
    if(!reference.tag.empty() && !reference.digest.empty()) {
        auto message = boost::format("Image reference '%s' has both a tag and a digest") % input;
        IRR_THROW_IMAGE_ERROR(ErrorKind::TagAndDigestPresent, message.str());
    }
}

void checkRegistryAndRepository(const Reference& reference, const std::string& input) {
    if(!reference.registry.empty() && !validation::isValidRegistryName(reference.registry)) {
        auto message = boost::format("Invalid registry '%s' in image reference '%s'") % reference.registry % input;
        IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidRegistryName, message.str());
    }
    if(!validation::isValidRepositoryName(reference.repository)) {
        auto message = boost::format("Invalid repository '%s' in image reference '%s'") % reference.repository % input;
        IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidRepositoryName, message.str());
    }
}

}

Parser::Parser(bool strict)
    : strict{strict}
{}

Reference Parser::split(const std::string& input) const {
    auto trimmed = boost::algorithm::trim_copy(input);
    if(trimmed.empty()) {
        IRR_THROW_IMAGE_ERROR(ErrorKind::EmptyReference, "Image reference is empty");
    }

    auto reference = Reference{};
    try {
        reference = parseWithGrammar(trimmed);
    }
    catch(ImageError& e) {
        if(strict) {
            auto message = boost::format("Failed to parse image reference '%s' in strict mode") % input;
            IRR_RETHROW_ERROR(e, message.str());
        }
        auto message = boost::format("Image reference '%s' rejected by the distribution grammar (%s),"
                                     " retrying with the lenient parser") % input % e.what();
        utility::printLog(message, libirr::LogLevel::DEBUG);
        reference = parseWithHeuristics(trimmed);
    }

    reference.original = input;
    return reference;
}

Reference Parser::parse(const std::string& input) const {
    auto reference = split(input);
    normalize(reference);
    return reference;
}

Reference Parser::parseWithGrammar(const std::string& input) const {
    auto match = regex::matchReference(input);
    if(!match) {
        auto message = boost::format("Image reference '%s' does not match the reference grammar") % input;
        IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidImageReference, message.str());
    }

    auto reference = Reference{};
    reference.tag = match->tag;
    reference.digest = match->digest;
    checkTagAndDigest(reference, input);

    std::tie(reference.registry, reference.repository) = splitRegistryAndRepository(match->name);
    checkRegistryAndRepository(reference, input);

    reference.detected = true;
    return reference;
}

Reference Parser::parseWithHeuristics(const std::string& input) const {
    for(const auto* separator : doubledSeparators) {
        if(input.find(separator) != std::string::npos) {
            auto message = boost::format("Image reference '%s' contains doubled separator '%s'") % input % separator;
            IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidImageReference, message.str());
        }
    }

    auto reference = Reference{};
    auto remainder = input;

    auto at = input.rfind('@');
    if(at != std::string::npos) {
        reference.digest = input.substr(at + 1);
        remainder = input.substr(0, at);
        if(reference.digest.empty()) {
            auto message = boost::format("Image reference '%s' has an empty digest") % input;
            IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidDigestFormat, message.str());
        }
    }

    if(remainder.find_first_of(disallowedCharacters) != std::string::npos) {
        auto message = boost::format("Image reference '%s' contains disallowed characters") % input;
        IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidImageReference, message.str());
    }

    // a colon before the first slash belongs to a registry port
    auto firstSlash = remainder.find('/');
    auto lastColon = remainder.rfind(':');
    if(lastColon != std::string::npos && (firstSlash == std::string::npos || lastColon > firstSlash)) {
        reference.tag = remainder.substr(lastColon + 1);
        remainder.erase(lastColon);
        if(reference.tag.empty()) {
            auto message = boost::format("Image reference '%s' has an empty tag") % input;
            IRR_THROW_IMAGE_ERROR(ErrorKind::InvalidTagFormat, message.str());
        }
    }

    checkTagAndDigest(reference, input);

    std::tie(reference.registry, reference.repository) = splitRegistryAndRepository(remainder);
    checkRegistryAndRepository(reference, input);

    reference.detected = false;
    return reference;
}

Reference parseImageReference(const std::string& input, bool strict) {
    return Parser{strict}.parse(input);
}

// Without this rule "bitnami/nginx" would be read as registry "bitnami"
std::pair<std::string, std::string> splitRegistryAndRepository(const std::string& name) {
    auto slash = name.find('/');
    if(slash == std::string::npos) {
        return {"", name};
    }
    auto firstSegment = name.substr(0, slash);
    if(firstSegment.find_first_of(".:") != std::string::npos || firstSegment == "localhost") {
        return {firstSegment, name.substr(slash + 1)};
    }
    return {"", name};
}

}
}
