/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/CLI.hpp"

#include <iostream>

#include <boost/format.hpp>

#include "libirr/Error.hpp"
#include "libirr/Logger.hpp"
#include "cli/CommandObjectsFactory.hpp"
#include "cli/Utility.hpp"


namespace irr {
namespace cli {

CLI::CLI() {
    optionsDescription.add_options()
        ("help,h", "Print this help message and quit")
        ("version", "Print the version and quit")
        ("verbose", "Log messages with level INFO or higher")
        ("debug", "Log messages with level DEBUG or higher");
}

std::unique_ptr<Command> CLI::parseCommandLine(const libirr::CLIArguments& args,
                                               std::shared_ptr<common::Config> config) const {
    auto grouped = utility::groupArguments(args, optionsDescription);
    auto values = parseGlobalOptions(grouped.nameAndOptions);
    setLogLevel(values);

    auto factory = CommandObjectsFactory{};

    // --help and --version win over any command
    if(values.count("help")) {
        return factory.makeCommandObject("help", libirr::CLIArguments{"help"}, std::move(config));
    }
    if(values.count("version")) {
        return factory.makeCommandObject("version", libirr::CLIArguments{"version"}, std::move(config));
    }
    if(grouped.positionals.empty()) {
        return factory.makeCommandObject("help", libirr::CLIArguments{"help"}, std::move(config));
    }

    const auto& commandName = *grouped.positionals.begin();
    utility::printLog(boost::format("creating object of command '%s'") % commandName, libirr::LogLevel::DEBUG);
    return factory.makeCommandObject(commandName, grouped.positionals, std::move(config));
}

boost::program_options::variables_map CLI::parseGlobalOptions(const libirr::CLIArguments& nameAndOptions) const {
    try {
        return utility::parseOptions(nameAndOptions, optionsDescription);
    }
    catch(const std::exception& e) {
        auto message = boost::format("%s\nSee 'irr help'") % e.what();
        utility::printLog(message, libirr::LogLevel::GENERAL, std::cerr);
        IRR_THROW_ERROR(message.str(), libirr::LogLevel::INFO);
    }
}

void CLI::setLogLevel(const boost::program_options::variables_map& values) const {
    auto level = libirr::LogLevel::WARN;
    if(values.count("debug")) {
        level = libirr::LogLevel::DEBUG;
    }
    else if(values.count("verbose")) {
        level = libirr::LogLevel::INFO;
    }
    libirr::Logger::getInstance().setLevel(level);
}

}
}
