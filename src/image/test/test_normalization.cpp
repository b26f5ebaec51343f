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

#include "image/Reference.hpp"
#include "image/normalization.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace irr::image;

TEST_GROUP(NormalizationTestGroup) {
};

TEST(NormalizationTestGroup, normalizeRegistry) {
    CHECK_EQUAL(normalizeRegistry(""), std::string{"docker.io"});
    CHECK_EQUAL(normalizeRegistry("docker.io"), std::string{"docker.io"});
    CHECK_EQUAL(normalizeRegistry("index.docker.io"), std::string{"docker.io"});
    CHECK_EQUAL(normalizeRegistry(" Docker.IO "), std::string{"docker.io"});
    CHECK_EQUAL(normalizeRegistry("Quay.io"), std::string{"quay.io"});
    CHECK_EQUAL(normalizeRegistry("registry:5000"), std::string{"registry"});
    CHECK_EQUAL(normalizeRegistry("registry.example.com:443/v2/"), std::string{"registry.example.com"});
    CHECK_EQUAL(normalizeRegistry("docker.io/"), std::string{"docker.io"});
    CHECK_EQUAL(normalizeRegistry("localhost"), std::string{"localhost"});
}

TEST(NormalizationTestGroup, defaults) {
    auto reference = Reference{};
    reference.repository = "nginx";
    normalize(reference);

    CHECK_EQUAL(reference.registry, std::string{"docker.io"});
    CHECK_EQUAL(reference.repository, std::string{"library/nginx"});
    CHECK_EQUAL(reference.tag, std::string{"latest"});
    CHECK(reference.digest.empty());
    CHECK_EQUAL(reference.original, std::string{"docker.io/library/nginx:latest"});
}

TEST(NormalizationTestGroup, libraryNamespaceOnlyOnDefaultRegistry) {
    auto reference = Reference{};
    reference.registry = "quay.io";
    reference.repository = "app";
    reference.tag = "1.0";
    normalize(reference);
    CHECK_EQUAL(reference.repository, std::string{"app"});

    reference = Reference{};
    reference.repository = "bitnami/redis";
    normalize(reference);
    CHECK_EQUAL(reference.repository, std::string{"bitnami/redis"});
}

TEST(NormalizationTestGroup, normalizeRepository) {
    CHECK_EQUAL(normalizeRepository("docker.io", "nginx"), std::string{"library/nginx"});
    CHECK_EQUAL(normalizeRepository("docker.io", "bitnami/redis"), std::string{"bitnami/redis"});
    CHECK_EQUAL(normalizeRepository("docker.io", ""), std::string{""});
    CHECK_EQUAL(normalizeRepository("quay.io", "app"), std::string{"app"});
    CHECK_EQUAL(normalizeRepository("", "app"), std::string{"app"});
}

TEST(NormalizationTestGroup, digestKeepsTagEmpty) {
    auto reference = Reference{};
    reference.repository = "nginx";
    reference.digest = "sha256:" + std::string(64, 'b');
    normalize(reference);
    CHECK(reference.tag.empty());
    CHECK_EQUAL(reference.digest, "sha256:" + std::string(64, 'b'));
}

TEST(NormalizationTestGroup, originalIsKept) {
    auto reference = Reference{};
    reference.repository = "nginx";
    reference.original = "nginx";
    normalize(reference);
    CHECK_EQUAL(reference.original, std::string{"nginx"});
}

TEST(NormalizationTestGroup, idempotence) {
    auto reference = Reference{};
    reference.registry = "Index.Docker.io:443";
    reference.repository = "redis";
    normalize(reference);

    auto normalizedOnce = reference;
    normalize(reference);
    CHECK(reference == normalizedOnce);
    CHECK_EQUAL(reference.original, normalizedOnce.original);
    CHECK_EQUAL(reference.string(), std::string{"docker.io/library/redis:latest"});
}

IRR_UNITTEST_MAIN_FUNCTION();
