/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include <fstream>

#include <boost/format.hpp>

#include "libirr/Error.hpp"


namespace test_utility {
namespace config {

ConfigRAII::~ConfigRAII() {
    if(!configDir.empty()) {
        boost::filesystem::remove_all(configDir);
    }
}

boost::filesystem::path getRepoRootDir() {
    return boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
}

boost::filesystem::path getConfigSchemaFile() {
    return getRepoRootDir() / "etc/irr.schema.json";
}

boost::filesystem::path writeFile(const boost::filesystem::path& file, const std::string& content) {
    boost::filesystem::create_directories(file.parent_path());
    auto os = std::ofstream{file.c_str()};
    if(!os) {
        auto message = boost::format("Failed to open %s for writing") % file;
        IRR_THROW_ERROR(message.str());
    }
    os << content;
    return file;
}

ConfigRAII makeConfig(const std::string& configJSON) {
    auto raii = ConfigRAII{};
    raii.configDir = boost::filesystem::temp_directory_path()
        / boost::filesystem::unique_path("irr-test-config-%%%%-%%%%-%%%%");

    auto configFile = writeFile(raii.configDir / "irr.json", configJSON);
    raii.config = std::make_shared<irr::common::Config>(configFile, getConfigSchemaFile());

    return raii;
}

}
}
