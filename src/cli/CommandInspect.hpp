/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandInspect_hpp
#define cli_CommandInspect_hpp

#include <iostream>
#include <memory>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "libirr/CLIArguments.hpp"
#include "libirr/Error.hpp"
#include "libirr/utility/json.hpp"
#include "libirr/utility/string.hpp"
#include "image/Detector.hpp"
#include "image/json.hpp"
#include "cli/Command.hpp"
#include "cli/Utility.hpp"


namespace irr {
namespace cli {

class CommandInspect : public Command {
public:
    CommandInspect() {
        initializeOptionsDescription();
    }

    CommandInspect(const libirr::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        auto parsed = parseArguments(args, 1, 1);
        try {
            applyOptions(parsed.options);
            this->conf->commandInspect.valuesFile = boost::filesystem::absolute(*parsed.positionals.begin());
        }
        catch(libirr::Error& e) {
            IRR_RETHROW_ERROR(e, "Failed to parse CLI arguments of inspect command");
        }
    }

    void execute() override {
        const auto& valuesFile = conf->commandInspect.valuesFile;
        auto values = image::json::toValue(libirr::json::read(valuesFile));
        auto result = image::Detector{conf->detectionContext}.detect(values);

        libirr::json::write(image::json::makeReport(result), std::cout);

        auto message = boost::format("Found %d image(s) and %d unsupported reference(s) in %s")
            % result.detected.size() % result.unsupported.size() % valuesFile;
        utility::printLog(message, libirr::LogLevel::INFO);
    }

    std::string getName() const override {
        return "inspect";
    }

    std::string getUsage() const override {
        return "irr inspect [OPTIONS] VALUES_FILE";
    }

    std::string getBriefDescription() const override {
        return "Detect the container image references in a values file";
    }

    std::string getDescription() const override {
        return getBriefDescription()
            + "\n\nVALUES_FILE is a JSON document. The detected images and the unsupported"
              " references are printed as a JSON report. The options override the settings"
              " of the configuration file.";
    }

private:
    void initializeOptionsDescription() {
        namespace po = boost::program_options;
        optionsDescription.add_options()
            ("config", po::value<std::string>(), "Read the settings from the specified configuration file")
            ("source-registries", po::value<std::string>(),
                "Comma-separated list of the registries whose images are detected")
            ("exclude-registries", po::value<std::string>(),
                "Comma-separated list of registries that are never detected")
            ("global-registry", po::value<std::string>(), "Registry of the images that do not specify one")
            ("strict", "Report every ambiguous or malformed reference as unsupported")
            ("template-mode", "Accept references containing template variables");
    }

    // --config is applied first so that the other options override it
    void applyOptions(const boost::program_options::variables_map& options) {
        if(options.count("config")) {
            conf->load(boost::filesystem::absolute(options["config"].as<std::string>()));
        }

        auto& context = conf->detectionContext;
        if(options.count("source-registries")) {
            context.sourceRegistries = libirr::string::parseList(options["source-registries"].as<std::string>());
        }
        if(options.count("exclude-registries")) {
            context.excludeRegistries = libirr::string::parseList(options["exclude-registries"].as<std::string>());
        }
        if(options.count("global-registry")) {
            context.globalRegistry = options["global-registry"].as<std::string>();
        }
        context.strict = context.strict || options.count("strict") > 0;
        context.templateMode = context.templateMode || options.count("template-mode") > 0;
    }

private:
    std::shared_ptr<common::Config> conf;
};

}
}

#endif
