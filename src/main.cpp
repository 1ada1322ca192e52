// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// fsguard -- Merkle integrity tool for files and directories.

#include "core/config.h"
#include "core/logging.h"
#include "guard/commands.h"
#include "guard/logging_init.h"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    core::Config config;
    config.parse_args(argc, argv);

    if (config.get_bool(core::CONF_HELP) || config.positional().empty()) {
        guard::print_usage(std::cout);
        return config.get_bool(core::CONF_HELP) ? guard::EXIT_OK
                                                 : guard::EXIT_ERROR;
    }

    if (auto conf_path = config.get(core::CONF_CONF)) {
        auto loaded = config.parse_file(*conf_path);
        if (!loaded.ok()) {
            std::cerr << "Error: " << loaded.error().message() << std::endl;
            return guard::EXIT_ERROR;
        }
    }

    auto logging = guard::init_logging(config);
    if (!logging.ok()) {
        std::cerr << "Error: " << logging.error().message() << std::endl;
        return guard::EXIT_ERROR;
    }

    int exit_code = guard::EXIT_ERROR;
    try {
        auto result = guard::run_command(config, std::cout);
        if (result.ok()) {
            exit_code = result.value();
        } else {
            LOG_ERROR(core::LogCategory::CLI, result.error().message());
            LOG_DEBUG(core::LogCategory::CLI, result.error().format());
        }
    } catch (const std::exception& e) {
        LOG_FATAL(core::LogCategory::CLI,
                  std::string("unexpected failure: ") + e.what());
    }

    core::Logger::instance().flush();
    return exit_code;
}
