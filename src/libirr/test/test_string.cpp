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
#include <vector>

#include "libirr/Error.hpp"
#include "libirr/utility/string.hpp"
#include "test_utility/unittest_main_function.hpp"

TEST_GROUP(StringTestGroup) {
};

TEST(StringTestGroup, parseList) {
    auto list = libirr::string::parseList("docker.io");
    CHECK_EQUAL(list.size(), 1);
    CHECK_EQUAL(list[0], std::string{"docker.io"});

    list = libirr::string::parseList("docker.io, quay.io ,gcr.io");
    CHECK_EQUAL(list.size(), 3);
    CHECK_EQUAL(list[0], std::string{"docker.io"});
    CHECK_EQUAL(list[1], std::string{"quay.io"});
    CHECK_EQUAL(list[2], std::string{"gcr.io"});

    list = libirr::string::parseList("docker.io;quay.io", ';');
    CHECK_EQUAL(list.size(), 2);
    CHECK_EQUAL(list[1], std::string{"quay.io"});

    CHECK(libirr::string::parseList("").empty());
    CHECK(libirr::string::parseList("  ").empty());

    CHECK_THROWS(libirr::Error, libirr::string::parseList("docker.io,"));
    CHECK_THROWS(libirr::Error, libirr::string::parseList(",docker.io"));
    CHECK_THROWS(libirr::Error, libirr::string::parseList("docker.io,,quay.io"));
}

TEST(StringTestGroup, isNumeric) {
    CHECK(libirr::string::isNumeric("5000"));
    CHECK(libirr::string::isNumeric("0"));
    CHECK_FALSE(libirr::string::isNumeric(""));
    CHECK_FALSE(libirr::string::isNumeric("50a0"));
    CHECK_FALSE(libirr::string::isNumeric("-1"));
    CHECK_FALSE(libirr::string::isNumeric(" 1"));
}

IRR_UNITTEST_MAIN_FUNCTION();
