/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CLI_hpp
#define cli_CLI_hpp

#include <memory>

#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "libirr/CLIArguments.hpp"
#include "cli/Command.hpp"


namespace irr {
namespace cli {

/**
 * Parses "irr [OPTIONS] COMMAND [ARGS]": applies the global options and
 * hands the rest of the command line over to the command object.
 */
class CLI {
public:
    CLI();

    std::unique_ptr<Command> parseCommandLine(const libirr::CLIArguments& args,
                                              std::shared_ptr<common::Config> config) const;

    const boost::program_options::options_description& getOptionsDescription() const {
        return optionsDescription;
    }

private:
    boost::program_options::variables_map parseGlobalOptions(const libirr::CLIArguments& nameAndOptions) const;
    void setLogLevel(const boost::program_options::variables_map& values) const;

private:
    boost::program_options::options_description optionsDescription{"Options"};
};

}
}

#endif
