/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/CommandObjectsFactory.hpp"

#include <iostream>

#include <boost/format.hpp>

#include "libirr/Error.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandInspect.hpp"
#include "cli/CommandVersion.hpp"
#include "cli/Utility.hpp"


namespace irr {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    registerCommand<CommandHelp>();
    registerCommand<CommandInspect>();
    registerCommand<CommandVersion>();
}

bool CommandObjectsFactory::isValidCommandName(const std::string& commandName) const {
    return makersByName.count(commandName) > 0;
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    for(const auto& entry : makersByName) {
        names.push_back(entry.first);
    }
    return names;
}

std::unique_ptr<Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    return getMakers(commandName).makeForHelp();
}

std::unique_ptr<Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName,
                                                                  const libirr::CLIArguments& args,
                                                                  std::shared_ptr<common::Config> config) const {
    return getMakers(commandName).make(args, std::move(config));
}

const CommandObjectsFactory::Makers& CommandObjectsFactory::getMakers(const std::string& commandName) const {
    auto it = makersByName.find(commandName);
    if(it == makersByName.cend()) {
        auto message = boost::format("'%s' is not an irr command\nSee 'irr help'") % commandName;
        utility::printLog(message, libirr::LogLevel::GENERAL, std::cerr);
        IRR_THROW_ERROR(message.str(), libirr::LogLevel::DEBUG);
    }
    return it->second;
}

}
}
