// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "guard/logging_init.h"
#include "guard/version.h"

#include "core/fs.h"
#include "core/logging.h"

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

namespace guard {

std::string get_version_string() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

std::string get_client_name() {
    return "fsguard v" + get_version_string();
}

core::Result<void> init_logging(const core::Config& config) {
    auto& logger = core::Logger::instance();

    std::string level_name = config.get_or(core::CONF_LOGLEVEL, "warn");
    std::optional<core::LogLevel> level = core::parse_log_level(level_name);
    if (!level) {
        return core::make_error(core::ErrorCode::CONFIG_RANGE,
                                "unknown -loglevel '" + level_name + "'");
    }

    std::string cat_names = config.get_or(core::CONF_LOGCATEGORIES, "all");
    std::optional<core::LogCategory> cats =
        core::parse_log_categories(cat_names);
    if (!cats) {
        return core::make_error(core::ErrorCode::CONFIG_RANGE,
                                "unknown -logcategories '" + cat_names + "'");
    }

    logger.set_level(*level);
    logger.set_categories(*cats);
    logger.set_console_stream(nullptr);
    logger.set_print_to_console(true);

    if (auto log_path = config.get(core::CONF_LOGFILE)) {
        std::filesystem::path p(*log_path);
        if (p.has_parent_path() &&
            !core::fs::ensure_directory(p.parent_path())) {
            return core::make_error(core::ErrorCode::IO_ERROR,
                                    "cannot create log directory " +
                                    p.parent_path().string());
        }
        if (!logger.set_log_file(p)) {
            return core::make_error(core::ErrorCode::IO_ERROR,
                                    "cannot open log file " + p.string());
        }
        logger.set_print_to_file(true);
    } else {
        logger.set_print_to_file(false);
    }

    LOG_DEBUG(core::LogCategory::CONFIG, get_startup_banner());
    LOG_DEBUG(core::LogCategory::CONFIG,
              "log level " + std::string(core::log_level_string(*level)) +
              ", categories '" + cat_names + "'");
    return core::make_ok();
}

std::string get_startup_banner() {
    std::ostringstream ss;
    ss << get_client_name() << " (built " << __DATE__ << ", "
#if defined(__clang__)
       << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(__GNUC__)
       << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
       << "unknown compiler"
#endif
       << ", C++ " << __cplusplus << ")";
    return ss.str();
}

}  // namespace guard
