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

#include <boost/filesystem.hpp>

#include "libirr/Error.hpp"
#include "common/Config.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace irr;

TEST_GROUP(ConfigTestGroup) {
};

TEST(ConfigTestGroup, installationPrefix) {
    auto config = common::Config{test_utility::config::getRepoRootDir()};
    const auto& context = config.detectionContext;

    CHECK(context.sourceRegistries == std::vector<std::string>{"docker.io"});
    CHECK(context.excludeRegistries.empty());
    CHECK(context.globalRegistry.empty());
    CHECK_FALSE(context.strict);
    CHECK_FALSE(context.templateMode);
    CHECK_FALSE(config.buildTime.version.empty());
}

TEST(ConfigTestGroup, allSettings) {
    auto raii = test_utility::config::makeConfig(
        "{\"sourceRegistries\": [\"docker.io\", \"quay.io\"],"
        " \"excludeRegistries\": [\"internal.example.com\"],"
        " \"globalRegistry\": \"mirror.example.com\","
        " \"strict\": true,"
        " \"templateMode\": true}");
    const auto& context = raii.config->detectionContext;

    CHECK((context.sourceRegistries == std::vector<std::string>{"docker.io", "quay.io"}));
    CHECK(context.excludeRegistries == std::vector<std::string>{"internal.example.com"});
    CHECK_EQUAL(context.globalRegistry, std::string{"mirror.example.com"});
    CHECK(context.strict);
    CHECK(context.templateMode);
}

TEST(ConfigTestGroup, emptyConfig) {
    auto raii = test_utility::config::makeConfig("{}");
    const auto& context = raii.config->detectionContext;

    CHECK(context.sourceRegistries.empty());
    CHECK_FALSE(context.strict);
}

TEST(ConfigTestGroup, invalidConfig) {
    // unknown setting
    CHECK_THROWS(libirr::Error, test_utility::config::makeConfig("{\"sourceRegistry\": [\"docker.io\"]}"));
    // wrong types
    CHECK_THROWS(libirr::Error, test_utility::config::makeConfig("{\"sourceRegistries\": \"docker.io\"}"));
    CHECK_THROWS(libirr::Error, test_utility::config::makeConfig("{\"strict\": \"yes\"}"));
    CHECK_THROWS(libirr::Error, test_utility::config::makeConfig("{\"sourceRegistries\": [\"\"]}"));
    // syntax error
    CHECK_THROWS(libirr::Error, test_utility::config::makeConfig("{\"strict\": true"));
}

TEST(ConfigTestGroup, missingConfigFile) {
    auto schema = test_utility::config::getConfigSchemaFile();
    CHECK_THROWS(libirr::Error, common::Config(boost::filesystem::path{"/nonexistent/irr.json"}, schema));
}

TEST(ConfigTestGroup, load) {
    auto raii = test_utility::config::makeConfig(
        "{\"sourceRegistries\": [\"quay.io\"], \"globalRegistry\": \"mirror.example.com\", \"strict\": true}");
    auto& config = *raii.config;
    CHECK(config.detectionContext.strict);

    auto otherFile = test_utility::config::writeFile(raii.configDir / "other.json",
                                                     "{\"sourceRegistries\": [\"ghcr.io\"]}");
    config.load(otherFile);

    // settings missing from the new file fall back to their defaults
    CHECK(config.detectionContext.sourceRegistries == std::vector<std::string>{"ghcr.io"});
    CHECK(config.detectionContext.globalRegistry.empty());
    CHECK_FALSE(config.detectionContext.strict);
    CHECK(config.json.HasMember("sourceRegistries"));
    CHECK_FALSE(config.json.HasMember("strict"));
}

TEST(ConfigTestGroup, loadInvalidFile) {
    auto raii = test_utility::config::makeConfig();
    auto invalidFile = test_utility::config::writeFile(raii.configDir / "invalid.json", "{\"strict\": 1}");
    CHECK_THROWS(libirr::Error, raii.config->load(invalidFile));
}

IRR_UNITTEST_MAIN_FUNCTION();
