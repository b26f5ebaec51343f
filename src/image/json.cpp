/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image/json.hpp"

#include <string>
#include <utility>

#include <boost/variant/static_visitor.hpp>

#include "libirr/Error.hpp"
#include "image/path.hpp"

namespace rj = rapidjson;

namespace irr {
namespace image {
namespace json {

namespace {

class JSONBuilder : public boost::static_visitor<> {
public:
    JSONBuilder(rj::Value& output, rj::MemoryPoolAllocator<>& allocator)
        : output(output)
        , allocator(allocator)
    {}

    void operator()(const Null&) const {
        output.SetNull();
    }

    void operator()(bool value) const {
        output.SetBool(value);
    }

    void operator()(std::int64_t value) const {
        output.SetInt64(value);
    }

    void operator()(double value) const {
        output.SetDouble(value);
    }

    void operator()(const std::string& value) const {
        output.SetString(value.c_str(), static_cast<rj::SizeType>(value.size()), allocator);
    }

    void operator()(const Sequence& sequence) const {
        output.SetArray();
        for(const auto& element : sequence) {
            output.PushBack(toJSON(element, allocator), allocator);
        }
    }

    void operator()(const Mapping& mapping) const {
        output.SetObject();
        for(const auto& entry : mapping) {
            output.AddMember(rj::Value{entry.first.c_str(), allocator}, toJSON(entry.second, allocator), allocator);
        }
    }

private:
    rj::Value& output;
    rj::MemoryPoolAllocator<>& allocator;
};

rj::Value makeString(const std::string& s, rj::MemoryPoolAllocator<>& allocator) {
    return rj::Value{s.c_str(), static_cast<rj::SizeType>(s.size()), allocator};
}

rj::Value makeDetectedImage(const DetectedImage& image, rj::MemoryPoolAllocator<>& allocator) {
    const auto& reference = image.reference;
    auto json = rj::Value{rj::kObjectType};
    json.AddMember("path", makeString(path::toString(image.path), allocator), allocator);
    json.AddMember("pattern", makeString(toString(image.pattern), allocator), allocator);
    json.AddMember("reference", makeString(reference.string(), allocator), allocator);
    json.AddMember("registry", makeString(reference.registry, allocator), allocator);
    json.AddMember("repository", makeString(reference.repository, allocator), allocator);
    json.AddMember("tag", makeString(reference.tag, allocator), allocator);
    json.AddMember("digest", makeString(reference.digest, allocator), allocator);
    json.AddMember("strictGrammar", reference.detected, allocator);
    json.AddMember("original", toJSON(image.original, allocator), allocator);
    return json;
}

rj::Value makeUnsupportedImage(const UnsupportedImage& image, rj::MemoryPoolAllocator<>& allocator) {
    auto json = rj::Value{rj::kObjectType};
    json.AddMember("path", makeString(path::toString(image.path), allocator), allocator);
    json.AddMember("type", makeString(toString(image.type), allocator), allocator);
    json.AddMember("error", makeString(image.cause.what(), allocator), allocator);

    auto kinds = rj::Value{rj::kArrayType};
    for(auto kind : image.cause.getKinds()) {
        kinds.PushBack(makeString(toString(kind), allocator), allocator);
    }
    json.AddMember("errorKinds", kinds, allocator);
    return json;
}

}

Value toValue(const rj::Value& json) {
    switch(json.GetType()) {
        case rj::kNullType:
            return Value{};
        case rj::kFalseType:
            return Value{false};
        case rj::kTrueType:
            return Value{true};
        case rj::kStringType:
            return Value{std::string{json.GetString(), json.GetStringLength()}};
        case rj::kNumberType:
            if(json.IsInt64()) {
                return Value{static_cast<std::int64_t>(json.GetInt64())};
            }
            return Value{json.GetDouble()};
        case rj::kArrayType: {
            auto sequence = Sequence{};
            sequence.reserve(json.Size());
            for(const auto& element : json.GetArray()) {
                sequence.push_back(toValue(element));
            }
            return Value{std::move(sequence)};
        }
        case rj::kObjectType: {
            auto mapping = Mapping{};
            for(const auto& member : json.GetObject()) {
                mapping.set(std::string{member.name.GetString(), member.name.GetStringLength()}, toValue(member.value));
            }
            return Value{std::move(mapping)};
        }
    }
    IRR_THROW_ERROR("Failed to convert JSON value of unknown type");
}

rj::Value toJSON(const Value& value, rj::MemoryPoolAllocator<>& allocator) {
    auto json = rj::Value{};
    auto builder = JSONBuilder{json, allocator};
    value.apply(builder);
    return json;
}

rj::Document makeReport(const DetectionResult& result) {
    auto report = rj::Document{rj::kObjectType};
    auto& allocator = report.GetAllocator();

    report.AddMember("globalRegistry", makeString(result.globalRegistry, allocator), allocator);

    auto detected = rj::Value{rj::kArrayType};
    for(const auto& image : result.detected) {
        detected.PushBack(makeDetectedImage(image, allocator), allocator);
    }
    report.AddMember("detected", detected, allocator);

    auto unsupported = rj::Value{rj::kArrayType};
    for(const auto& image : result.unsupported) {
        unsupported.PushBack(makeUnsupportedImage(image, allocator), allocator);
    }
    report.AddMember("unsupported", unsupported, allocator);

    return report;
}

}
}
}
