/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image/Value.hpp"

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include "image/ImageError.hpp"
#include "image/path.hpp"

namespace irr {
namespace image {

Value::Value()
    : variant{Null{}}
{}

Value::Value(Null)
    : variant{Null{}}
{}

Value::Value(bool value)
    : variant{value}
{}

Value::Value(int value)
    : variant{static_cast<std::int64_t>(value)}
{}

Value::Value(std::int64_t value)
    : variant{value}
{}

Value::Value(double value)
    : variant{value}
{}

Value::Value(const char* value)
    : variant{std::string{value}}
{}

Value::Value(std::string value)
    : variant{std::move(value)}
{}

Value::Value(Sequence value)
    : variant{std::move(value)}
{}

Value::Value(Mapping value)
    : variant{std::move(value)}
{}

bool Value::isNull() const {
    return boost::get<Null>(&variant) != nullptr;
}

bool Value::isString() const {
    return boost::get<std::string>(&variant) != nullptr;
}

bool Value::isSequence() const {
    return boost::get<Sequence>(&variant) != nullptr;
}

bool Value::isMapping() const {
    return boost::get<Mapping>(&variant) != nullptr;
}

const std::string& Value::getString() const {
    return boost::get<std::string>(variant);
}

const Sequence& Value::getSequence() const {
    return boost::get<Sequence>(variant);
}

const Mapping& Value::getMapping() const {
    return boost::get<Mapping>(variant);
}

bool operator==(const Value& lhs, const Value& rhs) {
    return lhs.getVariant() == rhs.getVariant();
}

bool operator!=(const Value& lhs, const Value& rhs) {
    return !(lhs == rhs);
}

Mapping::Mapping(std::initializer_list<Entry> entries)
    : entries{}
{
    for(const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

void Mapping::set(const std::string& key, Value value) {
    for(auto& entry : entries) {
        if(entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries.emplace_back(key, std::move(value));
}

const Value* Mapping::find(const std::string& key) const {
    for(const auto& entry : entries) {
        if(entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

bool operator==(const Mapping& lhs, const Mapping& rhs) {
    if(lhs.size() != rhs.size()) {
        return false;
    }
    auto it = rhs.begin();
    for(const auto& entry : lhs) {
        if(entry.first != it->first || entry.second != it->second) {
            return false;
        }
        ++it;
    }
    return true;
}

const Value& getValueAtPath(const Value& root, const Path& path) {
    const auto* current = &root;

    for(const auto& step : path) {
        auto index = std::size_t{};
        if(path::parseIndexStep(step, index)) {
            if(!current->isSequence() || index >= current->getSequence().size()) {
                auto message = boost::format("Failed to resolve path %s: no element %s") % path::toString(path) % step;
                IRR_THROW_IMAGE_ERROR(ErrorKind::PathNotFound, message.str());
            }
            current = &current->getSequence()[index];
        }
        else {
            const auto* child = current->isMapping() ? current->getMapping().find(step) : nullptr;
            if(child == nullptr) {
                auto message = boost::format("Failed to resolve path %s: no key '%s'") % path::toString(path) % step;
                IRR_THROW_IMAGE_ERROR(ErrorKind::PathNotFound, message.str());
            }
            current = child;
        }
    }

    return *current;
}

}
}
