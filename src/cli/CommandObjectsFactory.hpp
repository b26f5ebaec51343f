/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandObjectsFactory_hpp
#define cli_CommandObjectsFactory_hpp

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "libirr/CLIArguments.hpp"
#include "cli/Command.hpp"


namespace irr {
namespace cli {

/**
 * Creates command objects by name. Command names are listed in
 * alphabetical order.
 */
class CommandObjectsFactory {
public:
    CommandObjectsFactory();

    bool isValidCommandName(const std::string& commandName) const;
    std::vector<std::string> getCommandNames() const;

    // Command object suitable only for describing itself
    std::unique_ptr<Command> makeCommandObject(const std::string& commandName) const;

    // args start with the command name
    std::unique_ptr<Command> makeCommandObject(const std::string& commandName,
                                               const libirr::CLIArguments& args,
                                               std::shared_ptr<common::Config> config) const;

private:
    struct Makers {
        std::function<std::unique_ptr<Command>()> makeForHelp;
        std::function<std::unique_ptr<Command>(const libirr::CLIArguments&, std::shared_ptr<common::Config>)> make;
    };

    template<class CommandType>
    void registerCommand() {
        auto makers = Makers{};
        makers.makeForHelp = []() {
            return std::unique_ptr<Command>{new CommandType{}};
        };
        makers.make = [](const libirr::CLIArguments& args, std::shared_ptr<common::Config> config) {
            return std::unique_ptr<Command>{new CommandType{args, std::move(config)}};
        };
        makersByName[CommandType{}.getName()] = std::move(makers);
    }

    const Makers& getMakers(const std::string& commandName) const;

private:
    std::map<std::string, Makers> makersByName;
};

}
}

#endif
