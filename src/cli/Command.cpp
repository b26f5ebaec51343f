/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Command.hpp"

#include <boost/format.hpp>

#include "libirr/Error.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace irr {
namespace cli {

void Command::printHelpMessage(std::ostream& os) const {
    os << HelpMessage{}
        .setUsage(getUsage())
        .setDescription(getDescription())
        .setOptionsDescription(optionsDescription);
}

Command::ParsedArguments Command::parseArguments(const libirr::CLIArguments& args,
                                                 int minPositionals, int maxPositionals) const {
    utility::printLog(boost::format("parsing CLI arguments of %s command") % getName(), libirr::LogLevel::DEBUG);

    auto grouped = utility::groupArguments(args, optionsDescription);
    utility::checkPositionalArgumentsCount(grouped.positionals, minPositionals, maxPositionals, getName());

    auto parsed = ParsedArguments{};
    try {
        parsed.options = utility::parseOptions(grouped.nameAndOptions, optionsDescription);
    }
    catch(const std::exception& e) {
        auto message = boost::format("%s\nSee 'irr help %s'") % e.what() % getName();
        utility::printLog(message, libirr::LogLevel::GENERAL, std::cerr);
        IRR_THROW_ERROR(message.str(), libirr::LogLevel::INFO);
    }
    parsed.positionals = std::move(grouped.positionals);

    utility::printLog(boost::format("successfully parsed CLI arguments"), libirr::LogLevel::DEBUG);
    return parsed;
}

}
}
