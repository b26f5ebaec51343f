/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "image/regex.hpp"

#include "image/validation.hpp"


namespace irr {
namespace image {
namespace regex {

namespace {

std::string nonCapturing(const std::string& expr) {
    return "(?:" + expr + ")";
}

std::string zeroOrOne(const std::string& expr) {
    return nonCapturing(expr) + "?";
}

std::string zeroOrMore(const std::string& expr) {
    return nonCapturing(expr) + "*";
}

std::string captured(const std::string& expr) {
    return "(" + expr + ")";
}

// Atoms joined by a delimiter, e.g. "a.b.c" or "a/b/c"
std::string delimitedList(const std::string& atom, const std::string& delimiter) {
    return atom + zeroOrMore(delimiter + atom);
}

struct Grammar {
    std::string domain;
    std::string name;
    std::string tag;
    std::string digest;
    std::string reference;
};

Grammar makeGrammar() {
    // repository components are lower case; separators are a period,
    // one or two underscores, or a run of dashes
    auto component = delimitedList("[a-z0-9]+", "(?:[._]|__|[-]+)");

    // registry hostname labels accept upper case
    auto label = std::string{"(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])"};
    auto ipv6 = std::string{"\\[(?:[a-fA-F0-9:]+)\\]"};
    auto host = nonCapturing(delimitedList(label, "\\.") + "|" + ipv6);

    auto grammar = Grammar{};
    grammar.domain = host + zeroOrOne(":[0-9]+");
    grammar.name = zeroOrOne(grammar.domain + "/") + delimitedList(component, "/");
    grammar.tag = "[\\w][\\w.-]{0,127}";
    grammar.digest = "[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*:[0-9A-Fa-f]{32,}";
    // captures name, tag and digest in this order
    grammar.reference = "^" + captured(grammar.name)
                            + zeroOrOne(":" + captured(grammar.tag))
                            + zeroOrOne("@" + captured(grammar.digest))
                            + "$";
    return grammar;
}

const Grammar grammar = makeGrammar();

}

const boost::regex domain(grammar.domain);
const boost::regex name(grammar.name);
const boost::regex tag(grammar.tag);
const boost::regex digest(grammar.digest);
const boost::regex reference(grammar.reference);

boost::optional<ReferenceMatch> matchReference(const std::string& input) {
    auto matches = boost::smatch{};
    if(!boost::regex_match(input, matches, reference)) {
        return {};
    }
    auto match = ReferenceMatch{};
    match.name = matches[1];
    if(matches[2].matched) {
        match.tag = matches[2];
    }
    if(matches[3].matched) {
        match.digest = matches[3];
    }
    return match;
}

// Whether the input reads as an image reference on its own, regardless of
// where it was found: it must follow the grammar and pin a tag or a digest.
// Bare words like "nginx" or "true" are too common to count, and so are bare
// digests like the "sha256:..." checksums of config maps.
bool isTagOrDigestShaped(const std::string& input) {
    if(validation::isValidDigest(input)) {
        return false;
    }
    auto match = matchReference(input);
    return match && (!match->tag.empty() || !match->digest.empty());
}

}
}
}
