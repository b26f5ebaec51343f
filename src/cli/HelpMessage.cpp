/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/HelpMessage.hpp"


namespace irr {
namespace cli {

HelpMessage& HelpMessage::setUsage(const std::string& value) {
    usage = value;
    return *this;
}

HelpMessage& HelpMessage::setDescription(const std::string& value) {
    description = value;
    return *this;
}

HelpMessage& HelpMessage::setOptionsDescription(const boost::program_options::options_description& value) {
    optionsDescription = &value;
    return *this;
}

HelpMessage& HelpMessage::addCommand(const std::string& name, const std::string& briefDescription) {
    commands.emplace_back(name, briefDescription);
    return *this;
}

void HelpMessage::print(std::ostream& os) const {
    os << "Usage: " << usage << "\n";
    if(!description.empty()) {
        os << "\n" << description << "\n";
    }
    if(optionsDescription != nullptr && !optionsDescription->options().empty()) {
        os << "\n" << *optionsDescription;
    }
    if(!commands.empty()) {
        os << "\nCommands:\n";
        for(const auto& command : commands) {
            os << "   " << command.first << ": " << command.second << "\n";
        }
    }
}

std::ostream& operator<<(std::ostream& os, const HelpMessage& message) {
    message.print(os);
    return os;
}

}
}
