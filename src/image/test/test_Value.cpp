/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>

#include "image/ImageError.hpp"
#include "image/Value.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace irr::image;

TEST_GROUP(ValueTestGroup) {
};

TEST(ValueTestGroup, alternatives) {
    CHECK(Value{}.isNull());
    CHECK(Value{Null{}}.isNull());
    CHECK(Value{"nginx"}.isString());
    CHECK_EQUAL(Value{"nginx"}.getString(), std::string{"nginx"});
    CHECK(Value{Sequence{}}.isSequence());
    CHECK(Value{Mapping{}}.isMapping());

    CHECK_FALSE(Value{true}.isString());
    CHECK_FALSE(Value{3}.isNull());
    CHECK_FALSE(Value{2.5}.isMapping());
}

TEST(ValueTestGroup, equality) {
    CHECK(Value{1} == Value{std::int64_t{1}});
    CHECK(Value{1} != Value{1.0});
    CHECK(Value{"1"} != Value{1});
    CHECK(Value{true} != Value{"true"});
    CHECK((Value{Sequence{1, "a"}} == Value{Sequence{1, "a"}}));
    CHECK((Value{Sequence{1, "a"}} != Value{Sequence{"a", 1}}));
    CHECK((Value{Mapping{{"a", 1}, {"b", 2}}} == Value{Mapping{{"a", 1}, {"b", 2}}}));
    // the order of the entries is significant
    CHECK((Value{Mapping{{"a", 1}, {"b", 2}}} != Value{Mapping{{"b", 2}, {"a", 1}}}));
}

TEST(ValueTestGroup, mapping) {
    auto mapping = Mapping{{"repository", "nginx"}, {"tag", "1.25"}};
    CHECK_EQUAL(mapping.size(), 2);
    CHECK(mapping.find("tag") != nullptr);
    CHECK_EQUAL(mapping.find("tag")->getString(), std::string{"1.25"});
    CHECK(mapping.find("digest") == nullptr);

    mapping.set("tag", "1.26");
    mapping.set("registry", "quay.io");
    CHECK_EQUAL(mapping.size(), 3);
    CHECK_EQUAL(mapping.find("tag")->getString(), std::string{"1.26"});

    auto it = mapping.begin();
    CHECK_EQUAL(it->first, std::string{"repository"});
    ++it;
    CHECK_EQUAL(it->first, std::string{"tag"});
    ++it;
    CHECK_EQUAL(it->first, std::string{"registry"});

    // the last duplicate wins and keeps the position of the first
    auto duplicates = Mapping{{"a", 1}, {"b", 2}, {"a", 3}};
    CHECK_EQUAL(duplicates.size(), 2);
    CHECK(*duplicates.find("a") == Value{3});
    CHECK_EQUAL(duplicates.begin()->first, std::string{"a"});
}

TEST(ValueTestGroup, getValueAtPath) {
    auto root = Value{Mapping{
        {"spec", Mapping{
            {"containers", Sequence{
                Mapping{{"name", "app"}, {"image", "nginx:1.25"}},
                Mapping{{"name", "sidecar"}, {"image", "busybox"}}
            }}
        }},
        {"replicas", 3}
    }};

    CHECK(getValueAtPath(root, {}) == root);
    CHECK(getValueAtPath(root, {"replicas"}) == Value{3});
    CHECK_EQUAL(getValueAtPath(root, {"spec", "containers", "[1]", "image"}).getString(), std::string{"busybox"});
    CHECK(getValueAtPath(root, {"spec", "containers", "[0]"}).isMapping());
}

TEST(ValueTestGroup, getValueAtPath_notFound) {
    auto root = Value{Mapping{
        {"images", Sequence{"nginx"}},
        {"replicas", 3}
    }};

    CHECK_THROWS(ImageError, getValueAtPath(root, {"missing"}));
    CHECK_THROWS(ImageError, getValueAtPath(root, {"images", "[1]"}));
    CHECK_THROWS(ImageError, getValueAtPath(root, {"images", "name"}));
    CHECK_THROWS(ImageError, getValueAtPath(root, {"replicas", "value"}));
    CHECK_THROWS(ImageError, getValueAtPath(root, {"[0]"}));

    try {
        getValueAtPath(root, {"images", "[7]"});
        FAIL("expected an image error");
    }
    catch(const ImageError& e) {
        CHECK(e.getKind() == ErrorKind::PathNotFound);
    }
}

IRR_UNITTEST_MAIN_FUNCTION();
