/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_common_Config_hpp
#define irr_common_Config_hpp

#include <string>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "image/Detector.hpp"


namespace irr {
namespace common {

/**
 * Settings of a run: the validated JSON configuration file and the
 * detection context derived from it, possibly overridden from the
 * command line.
 */
class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);
        explicit Config(const boost::filesystem::path& installationPrefixDir);

        void load(const boost::filesystem::path& configFilename);

        struct BuildTime {
            BuildTime();
            std::string version;
        };

        struct CommandInspect {
            boost::filesystem::path valuesFile;
        };

        BuildTime buildTime;
        boost::filesystem::path configSchemaFilename;
        rapidjson::Document json{ rapidjson::kObjectType };
        image::DetectionContext detectionContext;
        CommandInspect commandInspect;

    private:
        void initializeDetectionContext();
};

}
}

#endif
