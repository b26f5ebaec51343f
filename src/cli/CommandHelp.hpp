/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandHelp_hpp
#define cli_CommandHelp_hpp

#include <iostream>
#include <memory>
#include <string>

#include "common/Config.hpp"
#include "libirr/CLIArguments.hpp"
#include "cli/CLI.hpp"
#include "cli/Command.hpp"
#include "cli/CommandObjectsFactory.hpp"
#include "cli/HelpMessage.hpp"

namespace irr {
namespace cli {

class CommandHelp : public Command {
public:
    CommandHelp() = default;

    CommandHelp(const libirr::CLIArguments& args, std::shared_ptr<common::Config>) {
        auto parsed = parseArguments(args, 0, 1);
        if(!parsed.positionals.empty()) {
            describedCommand = CommandObjectsFactory{}.makeCommandObject(*parsed.positionals.begin());
        }
    }

    void execute() override {
        if(describedCommand) {
            describedCommand->printHelpMessage();
        }
        else {
            printProgramHelpMessage(std::cout);
        }
    }

    std::string getName() const override {
        return "help";
    }

    std::string getUsage() const override {
        return "irr help [COMMAND]";
    }

    std::string getBriefDescription() const override {
        return "Print help message about a command";
    }

    // null when the help of the whole program is requested
    const Command* getDescribedCommand() const {
        return describedCommand.get();
    }

private:
    void printProgramHelpMessage(std::ostream& os) const {
        auto cli = CLI{};
        auto factory = CommandObjectsFactory{};
        auto message = HelpMessage{};
        message.setUsage("irr [OPTIONS] COMMAND [ARGS]")
            .setDescription("Detect the container image references of a values file")
            .setOptionsDescription(cli.getOptionsDescription());
        for(const auto& name : factory.getCommandNames()) {
            message.addCommand(name, factory.makeCommandObject(name)->getBriefDescription());
        }
        os << message;
    }

private:
    std::unique_ptr<Command> describedCommand;
};

}
}

#endif
