/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_Utility_hpp
#define cli_Utility_hpp

#include <iostream>
#include <string>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libirr/CLIArguments.hpp"
#include "libirr/LogLevel.hpp"

namespace irr {
namespace cli {
namespace utility {

// Tokens of a command line split at the first positional argument
struct GroupedArguments {
    libirr::CLIArguments nameAndOptions;
    libirr::CLIArguments positionals;
};

GroupedArguments groupArguments(const libirr::CLIArguments& args,
                                const boost::program_options::options_description& optionsDescription);

boost::program_options::variables_map parseOptions(const libirr::CLIArguments& nameAndOptions,
                                                   const boost::program_options::options_description& optionsDescription);

void checkPositionalArgumentsCount(const libirr::CLIArguments& positionals, int min, int max,
                                   const std::string& commandName);

void printLog(const std::string& message, libirr::LogLevel level,
              std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);
void printLog(const boost::format& message, libirr::LogLevel level,
              std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif
