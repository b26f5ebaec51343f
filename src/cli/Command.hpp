/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_Command_hpp
#define cli_Command_hpp

#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include "libirr/CLIArguments.hpp"

namespace irr {
namespace cli {

/**
 * A command of the irr program.
 *
 * Commands are created twice over: default-constructed to describe
 * themselves in help messages, and constructed from their command line
 * ("NAME [OPTIONS] ARGS...") to be executed.
 */
class Command {
public:
    struct ParsedArguments {
        boost::program_options::variables_map options;
        libirr::CLIArguments positionals;
    };

public:
    virtual ~Command() = default;

    virtual void execute() = 0;
    virtual std::string getName() const = 0;
    virtual std::string getUsage() const = 0;
    virtual std::string getBriefDescription() const = 0;

    virtual std::string getDescription() const {
        return getBriefDescription();
    }

    void printHelpMessage(std::ostream& os = std::cout) const;

protected:
    // Throws a libirr::Error with level INFO after telling the user what went wrong
    ParsedArguments parseArguments(const libirr::CLIArguments& args, int minPositionals, int maxPositionals) const;

protected:
    boost::program_options::options_description optionsDescription{"Options"};
};

}
}

#endif
