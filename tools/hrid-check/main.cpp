/**
 * @file main.cpp
 * @brief hrid-check - validate human-readable identifiers
 *
 * Checks each candidate (from argv, or one per line from stdin) against the
 * identifier grammar and reports the result in text or JSON form.
 */

#include "check_command.h"

#include "hrid/common/config_manager.h"
#include "hrid/common/logger.h"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    auto& config = hrid::common::ConfigManager::getInstance();

    hrid::common::Logger::initialize(
        "hrid-check",
        config.getString(hrid::common::ConfigManager::LOG_LEVEL, "warn"),
        config.getBool(hrid::common::ConfigManager::LOG_TO_FILE, false),
        config.getString(hrid::common::ConfigManager::LOG_FILE, "hrid-check.log")
    );

    const std::vector<std::string> args(argv + 1, argv + argc);

    int status = EXIT_FAILURE;
    try {
        status = hrid::check::run(args, std::cin, std::cout, std::cerr);
    } catch (const std::exception& e) {
        spdlog::critical("Unexpected error: {}", e.what());
    }

    hrid::common::Logger::flush();
    return status;
}
