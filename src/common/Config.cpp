/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include <vector>

#include <boost/format.hpp>

#include "libirr/Error.hpp"
#include "libirr/utility/json.hpp"
#include "libirr/utility/logging.hpp"


namespace irr {
namespace common {

namespace {

std::vector<std::string> readStringArray(const rapidjson::Value& array) {
    auto output = std::vector<std::string>{};
    for(const auto& element : array.GetArray()) {
        output.emplace_back(element.GetString(), element.GetStringLength());
    }
    return output;
}

}

Config::BuildTime::BuildTime()
    : version{IRR_VERSION}
{}

Config::Config(const boost::filesystem::path& installationPrefixDir)
    : Config{installationPrefixDir / "etc/irr.json", installationPrefixDir / "etc/irr.schema.json"}
{}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : configSchemaFilename{configSchemaFilename}
{
    load(configFilename);
}

// Replaces the current settings with those of another configuration file
void Config::load(const boost::filesystem::path& configFilename) {
    json = libirr::json::readAndValidate(configFilename, configSchemaFilename);
    detectionContext = image::DetectionContext{};
    initializeDetectionContext();
    auto message = boost::format("Loaded configuration %s") % configFilename;
    libirr::logMessage(message, libirr::LogLevel::DEBUG);
}

// The schema guarantees the types of the members that are present
void Config::initializeDetectionContext() {
    if(json.HasMember("sourceRegistries")) {
        detectionContext.sourceRegistries = readStringArray(json["sourceRegistries"]);
    }
    if(json.HasMember("excludeRegistries")) {
        detectionContext.excludeRegistries = readStringArray(json["excludeRegistries"]);
    }
    if(json.HasMember("globalRegistry")) {
        detectionContext.globalRegistry = json["globalRegistry"].GetString();
    }
    if(json.HasMember("strict")) {
        detectionContext.strict = json["strict"].GetBool();
    }
    if(json.HasMember("templateMode")) {
        detectionContext.templateMode = json["templateMode"].GetBool();
    }
}

}
}
