/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Utility functions to be used in the tests.
 */

#ifndef irr_test_utility_config_hpp
#define irr_test_utility_config_hpp

#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"

namespace test_utility {
namespace config {

// Removes the temporary directory holding the configuration file
struct ConfigRAII {
    ~ConfigRAII();
    std::shared_ptr<irr::common::Config> config;
    boost::filesystem::path configDir;
};

boost::filesystem::path getRepoRootDir();
boost::filesystem::path getConfigSchemaFile();
boost::filesystem::path writeFile(const boost::filesystem::path& file, const std::string& content);
ConfigRAII makeConfig(const std::string& configJSON = "{\"sourceRegistries\": [\"docker.io\"]}");

}
}

#endif
