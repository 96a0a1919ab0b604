/**
 * @file check_command.h
 * @brief Argument handling and reporting for hrid-check
 *
 * Kept apart from main() so the whole command can be driven with string
 * streams.
 */

#pragma once

#include "hrid/hash.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace hrid {
namespace check {

constexpr int EXIT_ALL_VALID = 0;
constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_USAGE = 2;

/**
 * @brief Command-line options
 */
struct Options {
    bool help = false;
    bool json = false;
    std::optional<HashAlgorithm> hash;
    int uuidCount = 0;
    std::string fromUuid;
    std::vector<std::string> candidates;
};

void printUsage(std::ostream& os);

/**
 * @brief Parse arguments (program name excluded)
 *
 * The output format default comes from HRID_OUTPUT_FORMAT and the --hash
 * default from HRID_HASH_ALGORITHM.
 *
 * @return std::nullopt on an unknown option or a bad count, after writing a
 *         diagnostic to err
 * @throws std::invalid_argument on a bad hash algorithm or count
 * @throws ConfigException on a bad HRID_OUTPUT_FORMAT
 */
std::optional<Options> parseArgs(const std::vector<std::string>& args, std::ostream& err);

/**
 * @brief Check one candidate and write its report line
 * @return true if the candidate is a legal identifier
 */
bool check(const std::string& candidate, const Options& opts, std::ostream& out);

/**
 * @brief Run the command
 *
 * Candidates come from args, or one per line from in when none are given.
 * Usage and configuration errors are reported on err.
 *
 * @return EXIT_ALL_VALID, EXIT_REJECTED or EXIT_USAGE
 */
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace check
} // namespace hrid
