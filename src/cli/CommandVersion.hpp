/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandVersion_hpp
#define cli_CommandVersion_hpp

#include <memory>
#include <string>

#include "common/Config.hpp"
#include "libirr/CLIArguments.hpp"
#include "libirr/Logger.hpp"
#include "cli/Command.hpp"


namespace irr {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion() = default;

    CommandVersion(const libirr::CLIArguments& args, std::shared_ptr<const common::Config> conf)
        : conf{std::move(conf)}
    {
        parseArguments(args, 0, 0);
    }

    void execute() override {
        libirr::Logger::getInstance().log(conf->buildTime.version, "CommandVersion", libirr::LogLevel::GENERAL);
    }

    std::string getName() const override {
        return "version";
    }

    std::string getUsage() const override {
        return "irr version";
    }

    std::string getBriefDescription() const override {
        return "Show the irr version information";
    }

private:
    std::shared_ptr<const common::Config> conf;
};

}
}

#endif
