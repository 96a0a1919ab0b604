/**
 * @file check_command.cpp
 * @brief hrid-check command implementation
 */

#include "check_command.h"

#include "hrid/common/config_manager.h"
#include "hrid/grammar.h"
#include "hrid/id.h"
#include "hrid/serde/json.h"
#include "hrid/uuid.h"

#include <stdexcept>
#include <json/json.h>
#include <spdlog/spdlog.h>

namespace hrid {
namespace check {

namespace {

void printId(const Id& id, const Options& opts, std::ostream& out) {
    if (opts.json) {
        Json::Value report;
        report["input"] = id.getValue();
        report["valid"] = true;
        report["id"] = serde::toJson(id);
        if (opts.hash) {
            report["hash"] = contentHashHex(id, *opts.hash);
            report["hashAlgorithm"] = hashAlgorithmToString(*opts.hash);
        }
        out << Json::writeString(serde::compactWriter(), report) << "\n";
        return;
    }

    out << "OK " << id;
    if (opts.hash) {
        out << " " << hashAlgorithmToString(*opts.hash) << ":" << contentHashHex(id, *opts.hash);
    }
    out << "\n";
}

int execute(const Options& opts, std::istream& in, std::ostream& out) {
    if (opts.uuidCount > 0) {
        for (int i = 0; i < opts.uuidCount; ++i) {
            printId(newRandomId(), opts, out);
        }
        return EXIT_ALL_VALID;
    }

    if (!opts.fromUuid.empty()) {
        printId(fromUuidString(opts.fromUuid), opts, out);
        return EXIT_ALL_VALID;
    }

    bool allValid = true;
    std::size_t checked = 0;

    if (!opts.candidates.empty()) {
        for (const auto& candidate : opts.candidates) {
            allValid = check(candidate, opts, out) && allValid;
            ++checked;
        }
    } else {
        std::string line;
        while (std::getline(in, line)) {
            allValid = check(line, opts, out) && allValid;
            ++checked;
        }
    }

    spdlog::info("Checked {} candidate(s), all valid: {}", checked, allValid);
    return allValid ? EXIT_ALL_VALID : EXIT_REJECTED;
}

} // namespace

void printUsage(std::ostream& os) {
    os << "Usage: hrid-check [options] [candidate ...]\n"
       << "\n"
       << "Validates human-readable identifiers. Reads one candidate per line\n"
       << "from stdin when none are given.\n"
       << "\n"
       << "Options:\n"
       << "  --json               one JSON object per candidate\n"
       << "  --hash[=ALGO]        add the content hash (sha256, sha384, sha512)\n"
       << "  --uuid N             print N random UUID identifiers and exit\n"
       << "  --from-uuid TEXT     print the canonical identifier for a UUID and exit\n"
       << "  -h, --help           show this help\n"
       << "\n"
       << "Environment:\n"
       << "  HRID_LOG_LEVEL, HRID_LOG_TO_FILE, HRID_LOG_FILE,\n"
       << "  HRID_HASH_ALGORITHM, HRID_OUTPUT_FORMAT (text|json)\n";
}

std::optional<Options> parseArgs(const std::vector<std::string>& args, std::ostream& err) {
    auto& config = common::ConfigManager::getInstance();

    Options opts;
    opts.json = config.getChoice(common::ConfigManager::OUTPUT_FORMAT, "text", {"text", "json"}) == "json";

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--hash") {
            opts.hash = hashAlgorithmFromString(
                config.getString(common::ConfigManager::HASH_ALGORITHM, "sha256"));
        } else if (arg.rfind("--hash=", 0) == 0) {
            opts.hash = hashAlgorithmFromString(arg.substr(7));
        } else if (arg == "--uuid" && i + 1 < args.size()) {
            opts.uuidCount = std::stoi(args[++i]);
            if (opts.uuidCount <= 0) {
                err << "--uuid expects a positive count\n";
                return std::nullopt;
            }
        } else if (arg == "--from-uuid" && i + 1 < args.size()) {
            opts.fromUuid = args[++i];
        } else if (arg == "--") {
            opts.candidates.insert(opts.candidates.end(), args.begin() + i + 1, args.end());
            break;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            err << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            opts.candidates.push_back(arg);
        }
    }

    return opts;
}

bool check(const std::string& candidate, const Options& opts, std::ostream& out) {
    const ValidationResult result = checkGrammar(candidate);

    if (result.valid) {
        printId(Id::of(candidate), opts, out);
        return true;
    }

    if (opts.json) {
        Json::Value report;
        report["input"] = candidate;
        report["valid"] = false;
        report["rule"] = ruleToString(result.rule);
        report["offset"] = static_cast<Json::UInt64>(result.offset);
        report["message"] = result.message;
        out << Json::writeString(serde::compactWriter(), report) << "\n";
    } else {
        out << "REJECTED " << ruleToString(result.rule) << " " << result.message << "\n";
    }
    return false;
}

int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    try {
        const auto opts = parseArgs(args, err);
        if (!opts) {
            printUsage(err);
            return EXIT_USAGE;
        }

        if (opts->help) {
            printUsage(out);
            return EXIT_ALL_VALID;
        }

        return execute(*opts, in, out);
    } catch (const ConfigException& e) {
        err << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const std::invalid_argument& e) {
        err << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const std::out_of_range& e) {
        err << "Argument out of range: " << e.what() << "\n";
        return EXIT_USAGE;
    }
}

} // namespace check
} // namespace hrid
