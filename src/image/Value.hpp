/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_image_Value_hpp
#define irr_image_Value_hpp

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include <boost/variant.hpp>

#include "image/Reference.hpp"

namespace irr {
namespace image {

class Value;
class Mapping;

struct Null {};

inline bool operator==(Null, Null) {
    return true;
}

using Sequence = std::vector<Value>;

/**
 * Node of a decoded configuration document (e.g. Helm values).
 *
 * A closed union of null, boolean, integer, floating point, string,
 * sequence and mapping. Consumers dispatch on the alternative with a
 * boost::static_visitor through apply().
 */
class Value {
public:
    using Variant = boost::variant<Null,
                                   bool,
                                   std::int64_t,
                                   double,
                                   std::string,
                                   boost::recursive_wrapper<Sequence>,
                                   boost::recursive_wrapper<Mapping>>;

public:
    Value();
    Value(Null);
    Value(bool);
    Value(int);
    Value(std::int64_t);
    Value(double);
    Value(const char*);
    Value(std::string);
    Value(Sequence);
    Value(Mapping);

    bool isNull() const;
    bool isString() const;
    bool isSequence() const;
    bool isMapping() const;

    const std::string& getString() const;
    const Sequence& getSequence() const;
    const Mapping& getMapping() const;

    const Variant& getVariant() const {
        return variant;
    }

    template<class Visitor>
    typename Visitor::result_type apply(Visitor& visitor) const {
        return boost::apply_visitor(visitor, variant);
    }

private:
    Variant variant;
};

bool operator==(const Value&, const Value&);
bool operator!=(const Value&, const Value&);

/**
 * String-keyed mapping that keeps its entries in document order, so that
 * traversals and reports are stable for a given input.
 */
class Mapping {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

public:
    Mapping() = default;
    Mapping(std::initializer_list<Entry> entries);

    // Replaces the value of an existing key, appends otherwise
    void set(const std::string& key, Value value);
    const Value* find(const std::string& key) const;

    const_iterator begin() const { return entries.cbegin(); }
    const_iterator end() const { return entries.cend(); }
    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

private:
    std::vector<Entry> entries;
};

bool operator==(const Mapping&, const Mapping&);

// Resolves a path as produced by the detector. Throws ImageError(PathNotFound).
const Value& getValueAtPath(const Value& root, const Path& path);

}
}

#endif
