#ifndef PRIVACYGUARD_CLI_COMMAND_LINE_HPP
#define PRIVACYGUARD_CLI_COMMAND_LINE_HPP

#include <string>

/**
 * @file command_line.hpp
 * @brief Argument parsing for the privacyguard executable.
 *
 *   privacyguard anonymize [--config FILE] [--lang L] [--table FILE | --vault]
 *   privacyguard restore   [--config FILE] (--table FILE | --vault ID)
 */

namespace privacyguard {
namespace cli {

enum ExitCode {
    kExitSuccess = 0,
    kExitFailure = 1, // runtime error, logged at ERROR
    kExitUsage = 2
};

struct CliOptions
{
    std::string command;
    std::string configPath = "privacyguard.conf";
    std::string language;
    std::string tablePath;
    std::string vaultId;
    bool useVault = false;
};

/**
 * @brief Fill opts from argv.
 * @return false on a usage error; main() then exits with kExitUsage.
 */
inline bool parseArgs(int argc, char** argv, CliOptions& opts)
{
    if (argc < 2) {
        return false;
    }
    opts.command = argv[1];
    if (opts.command != "anonymize" && opts.command != "restore") {
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!needValue(opts.configPath)) return false;
        } else if (arg == "--lang") {
            if (!needValue(opts.language)) return false;
        } else if (arg == "--table") {
            if (!needValue(opts.tablePath)) return false;
        } else if (arg == "--vault") {
            opts.useVault = true;
            if (opts.command == "restore" && !needValue(opts.vaultId)) return false;
        } else {
            return false;
        }
    }

    // The table has exactly one destination (or source).
    if (!opts.tablePath.empty() && opts.useVault) {
        return false;
    }
    if (opts.command == "restore" && opts.tablePath.empty() && !opts.useVault) {
        return false;
    }
    return true;
}

} // namespace cli
} // namespace privacyguard

#endif // PRIVACYGUARD_CLI_COMMAND_LINE_HPP
