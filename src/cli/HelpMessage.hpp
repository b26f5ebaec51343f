/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_HelpMessage_hpp
#define cli_HelpMessage_hpp

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>


namespace irr {
namespace cli {

/**
 * Help text of the program or of one of its commands:
 *
 *   Usage: <usage>
 *
 *   <description>
 *
 *   <options>
 *
 *   Commands:
 *      <name>: <brief description>
 *
 * Empty sections are left out. The options description is referenced, not
 * copied, so it must outlive the message.
 */
class HelpMessage {
public:
    HelpMessage& setUsage(const std::string&);
    HelpMessage& setDescription(const std::string&);
    HelpMessage& setOptionsDescription(const boost::program_options::options_description&);
    HelpMessage& addCommand(const std::string& name, const std::string& briefDescription);

    void print(std::ostream&) const;

private:
    std::string usage;
    std::string description;
    const boost::program_options::options_description* optionsDescription = nullptr;
    std::vector<std::pair<std::string, std::string>> commands;
};

std::ostream& operator<<(std::ostream&, const HelpMessage&);

}
}

#endif
