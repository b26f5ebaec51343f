/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include "libirr/Error.hpp"
#include "libirr/Logger.hpp"


namespace irr {
namespace cli {
namespace utility {

namespace {

/**
 * Walks the tokens that follow the program (or command) name and moves
 * each option, together with its value when the option takes one, to the
 * name-and-options group. Scanning stops at the first positional token.
 */
class ArgumentScanner {
public:
    using Iterator = libirr::CLIArguments::const_iterator;

    ArgumentScanner(const boost::program_options::options_description& optionsDescription,
                    GroupedArguments& output)
        : optionsDescription(optionsDescription)
        , output(output)
    {}

    void scan(Iterator first, Iterator last) {
        for(current = first, end = last; current != end; ++current) {
            if(isLongOption(*current)) {
                takeLongOption();
            }
            else if(isShortOption(*current)) {
                takeShortOptions();
            }
            else {
                output.positionals = libirr::CLIArguments{current, end};
                return;
            }
        }
    }

private:
    static bool isShortOption(const std::string& token) {
        return token.size() > 1 && token[0] == '-' && token[1] != '-';
    }

    static bool isLongOption(const std::string& token) {
        return token.size() > 2 && boost::starts_with(token, "--") && token[2] != '-';
    }

    // unknown options are kept as flags, boost reports them later
    bool takesValue(const std::string& name, bool isShort) const {
        const auto* option = optionsDescription.find_nothrow(isShort ? "-" + name : name, false);
        return option != nullptr && option->semantic()->max_tokens() > 0;
    }

    // the value of an option may be the next token, unless that is an option
    void takeWithSeparateValue() {
        output.nameAndOptions.push_back(*current);
        auto next = current + 1;
        if(next != end && !boost::starts_with(*next, "-")) {
            output.nameAndOptions.push_back(*next);
            current = next;
        }
    }

    void takeLongOption() {
        auto name = current->substr(2);
        if(name.find('=') == std::string::npos && takesValue(name, false)) {
            takeWithSeparateValue();
        }
        else {
            output.nameAndOptions.push_back(*current);
        }
    }

    // "-abc" holds flags a and b, and either flag c or option c whose value
    // follows in the next token. A letter taking a value ends the group.
    void takeShortOptions() {
        const auto& token = *current;
        for(std::size_t i=1; i<token.size(); ++i) {
            auto letter = std::string(1, token[i]);
            if(optionsDescription.find_nothrow("-" + letter, false) == nullptr) {
                break;
            }
            if(takesValue(letter, true)) {
                if(i + 1 == token.size()) {
                    takeWithSeparateValue();
                    return;
                }
                break;
            }
        }
        output.nameAndOptions.push_back(token);
    }

private:
    const boost::program_options::options_description& optionsDescription;
    GroupedArguments& output;
    Iterator current;
    Iterator end;
};

}

/**
 * Splits a command line at its first positional token.
 *
 * "irr --verbose inspect --strict values.json" yields the name and options
 * "irr --verbose" and the positionals "inspect --strict values.json", so
 * that the positionals can be handed over to the command as they are.
 * Options follow the UNIX style of boost::program_options: long options with
 * an adjacent ("--config=FILE") or separate value, short options and sticky
 * short options.
 */
GroupedArguments groupArguments(const libirr::CLIArguments& args,
                                const boost::program_options::options_description& optionsDescription) {
    auto grouped = GroupedArguments{};
    if(args.empty()) {
        return grouped;
    }

    grouped.nameAndOptions.push_back(*args.begin());
    ArgumentScanner{optionsDescription, grouped}.scan(args.begin() + 1, args.end());
    return grouped;
}

boost::program_options::variables_map parseOptions(const libirr::CLIArguments& nameAndOptions,
                                                   const boost::program_options::options_description& optionsDescription) {
    namespace po = boost::program_options;
    auto values = po::variables_map{};
    po::store(po::command_line_parser(nameAndOptions.argc(), nameAndOptions.argv())
                  .options(optionsDescription)
                  .style(po::command_line_style::unix_style)
                  .run(),
              values);
    po::notify(values);
    return values;
}

void checkPositionalArgumentsCount(const libirr::CLIArguments& positionals, int min, int max,
                                   const std::string& commandName) {
    auto count = positionals.argc();
    if(count >= min && count <= max) {
        return;
    }
    auto message = boost::format("Too %s arguments for command '%s'\nSee 'irr help %s'")
        % (count < min ? "few" : "many") % commandName % commandName;
    printLog(message, libirr::LogLevel::GENERAL, std::cerr);
    IRR_THROW_ERROR(message.str(), libirr::LogLevel::INFO);
}

void printLog(const std::string& message, libirr::LogLevel level, std::ostream& outStream, std::ostream& errStream) {
    libirr::Logger::getInstance().log(message, "CLI", level, outStream, errStream);
}

void printLog(const boost::format& message, libirr::LogLevel level, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), level, outStream, errStream);
}

}
}
}
