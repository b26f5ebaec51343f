/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <climits>
#include <string>

#include <boost/program_options.hpp>

#include "libirr/Error.hpp"
#include "libirr/CLIArguments.hpp"
#include "cli/Utility.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace irr;

TEST_GROUP(CLIUtilityTestGroup) {
};

static boost::program_options::options_description makeInspectLikeOptions() {
    auto optionsDescription = boost::program_options::options_description{};
    optionsDescription.add_options()
        ("config,c", boost::program_options::value<std::string>(), "Configuration file")
        ("strict,s", "Strict mode")
        ("template-mode,t", "Template mode");
    return optionsDescription;
}

static void checkGrouping(const libirr::CLIArguments& args,
                          const libirr::CLIArguments& expectedNameAndOptionArgs,
                          const libirr::CLIArguments& expectedPositionalArgs) {
    auto optionsDescription = makeInspectLikeOptions();
    auto grouped = cli::utility::groupArguments(args, optionsDescription);
    CHECK(grouped.nameAndOptions == expectedNameAndOptionArgs);
    CHECK(grouped.positionals == expectedPositionalArgs);
}

TEST(CLIUtilityTestGroup, groupArguments) {
    checkGrouping({"inspect"}, {"inspect"}, {});
    checkGrouping({"inspect", "values.json"}, {"inspect"}, {"values.json"});
    checkGrouping({"inspect", "--strict", "values.json"}, {"inspect", "--strict"}, {"values.json"});

    // options after the first positional argument belong to the positionals
    checkGrouping({"inspect", "values.json", "--strict"}, {"inspect"}, {"values.json", "--strict"});

    // long option with adjacent and separated value
    checkGrouping({"inspect", "--config=irr.json", "values.json"},
                  {"inspect", "--config=irr.json"},
                  {"values.json"});
    checkGrouping({"inspect", "--config", "irr.json", "--strict", "values.json"},
                  {"inspect", "--config", "irr.json", "--strict"},
                  {"values.json"});

    // option accepting a value given as last argument
    checkGrouping({"inspect", "--strict", "--config"}, {"inspect", "--strict", "--config"}, {});

    // short options, sticky and with value
    checkGrouping({"inspect", "-st", "values.json"}, {"inspect", "-st"}, {"values.json"});
    checkGrouping({"inspect", "-cirr.json", "values.json"}, {"inspect", "-cirr.json"}, {"values.json"});
    checkGrouping({"inspect", "-sc", "irr.json", "values.json"}, {"inspect", "-sc", "irr.json"}, {"values.json"});

    // unknown options are kept for the parser to reject
    checkGrouping({"inspect", "--unknown", "values.json"}, {"inspect", "--unknown"}, {"values.json"});
}

TEST(CLIUtilityTestGroup, checkPositionalArgumentsCount) {
    cli::utility::checkPositionalArgumentsCount({}, 0, 0, "command");
    cli::utility::checkPositionalArgumentsCount({"arg0"}, 1, 1, "command");
    cli::utility::checkPositionalArgumentsCount({"arg0", "arg1", "arg2"}, 1, INT_MAX, "command");

    // too few
    CHECK_THROWS(libirr::Error, cli::utility::checkPositionalArgumentsCount({}, 1, 1, "command"));
    CHECK_THROWS(libirr::Error, cli::utility::checkPositionalArgumentsCount({"arg0"}, 2, INT_MAX, "command"));
    // too many
    CHECK_THROWS(libirr::Error, cli::utility::checkPositionalArgumentsCount({"arg0"}, 0, 0, "command"));
    CHECK_THROWS(libirr::Error, cli::utility::checkPositionalArgumentsCount({"arg0", "arg1"}, 1, 1, "command"));
}

TEST(CLIUtilityTestGroup, parseOptions) {
    auto optionsDescription = makeInspectLikeOptions();

    auto values = cli::utility::parseOptions({"inspect", "-s", "--config=irr.json"}, optionsDescription);
    CHECK(values.count("strict") == 1);
    CHECK(values.count("template-mode") == 0);
    CHECK_EQUAL(values["config"].as<std::string>(), std::string{"irr.json"});

    CHECK_THROWS(boost::program_options::error,
                 cli::utility::parseOptions({"inspect", "--unknown"}, optionsDescription));
    CHECK_THROWS(boost::program_options::error,
                 cli::utility::parseOptions({"inspect", "--config"}, optionsDescription));
}

IRR_UNITTEST_MAIN_FUNCTION();
