/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <clocale>
#include <exception>
#include <memory>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libirr/CLIArguments.hpp"
#include "libirr/Error.hpp"
#include "libirr/Logger.hpp"
#include "cli/CLI.hpp"

using namespace irr;

namespace {

// The executable is installed as <prefix>/bin/irr
boost::filesystem::path getInstallationPrefixDir() {
    return boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
}

void run(const libirr::CLIArguments& args) {
    auto config = std::make_shared<common::Config>(getInstallationPrefixDir());
    auto command = cli::CLI{}.parseCommandLine(args, std::move(config));
    command->execute();
}

}

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8");

    auto& logger = libirr::Logger::getInstance();
    try {
        run(libirr::CLIArguments(argc, argv));
        return 0;
    }
    catch(const libirr::Error& e) {
        logger.logErrorTrace(e, "main");
    }
    catch(const std::exception& e) {
        auto message = boost::format("Unexpected %s without error trace: %s")
            % libirr::getExceptionTypeString(e) % e.what();
        logger.log(message.str(), "main", libirr::LogLevel::ERROR);
    }
    return 1;
}
