#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "cli/command_line.hpp"
#include "guard/privacy_guard.hpp"
#include "storage/restoration_vault.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

namespace logger = privacyguard::util::logger;

using privacyguard::cli::CliOptions;

void printUsage() {
    std::cerr << "usage:\n"
                 "  privacyguard anonymize [--config FILE] [--lang L] [--table FILE | --vault]\n"
                 "  privacyguard restore   [--config FILE] (--table FILE | --vault ID)\n"
                 "Text is read from stdin and written to stdout.\n";
}

std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw privacyguard::GuardError("cannot open " + path);
    }
    return readAll(in);
}

void writeFile(const std::string& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open() || !(out << data)) {
        throw privacyguard::GuardError("cannot write " + path);
    }
}

int runAnonymize(const CliOptions& opts, const privacyguard::config::GuardConfig& cfg) {
    privacyguard::PrivacyGuard guard = privacyguard::PrivacyGuard::fromConfig(cfg);
    const std::string language = opts.language.empty() ? cfg.defaultLanguage : opts.language;

    auto result = guard.anonymize(readAll(std::cin), language);
    std::cout << result.sanitizedText;
    std::cout.flush();

    if (opts.useVault) {
        privacyguard::storage::RestorationVault vault(cfg.vaultPath);
        std::string id = privacyguard::storage::RestorationVault::DocumentId(result.sanitizedText, result.table);
        vault.Store(id, result.table);
        std::cerr << id << std::endl;
    } else if (!opts.tablePath.empty()) {
        writeFile(opts.tablePath, privacyguard::core::tableToJson(result.table));
    } else {
        std::cerr << privacyguard::core::tableToJson(result.table) << std::endl;
    }
    return privacyguard::cli::kExitSuccess;
}

int runRestore(const CliOptions& opts, const privacyguard::config::GuardConfig& cfg) {
    privacyguard::core::RestorationTable table;
    if (opts.useVault) {
        privacyguard::storage::RestorationVault vault(cfg.vaultPath);
        auto loaded = vault.Load(opts.vaultId);
        if (!loaded) {
            logger::error("[main] No restoration table stored under " + opts.vaultId);
            return privacyguard::cli::kExitFailure;
        }
        table = std::move(*loaded);
    } else {
        table = privacyguard::core::tableFromJson(readFile(opts.tablePath));
    }

    privacyguard::PrivacyGuard guard(cfg.workerThreads);
    std::cout << guard.restore(readAll(std::cin), table);
    std::cout.flush();
    return privacyguard::cli::kExitSuccess;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    if (!privacyguard::cli::parseArgs(argc, argv, opts)) {
        printUsage();
        return privacyguard::cli::kExitUsage;
    }

    try {
        privacyguard::config::GuardConfig cfg;
        privacyguard::util::ConfigParser parser(cfg);
        parser.loadFromFile(opts.configPath);

        logger::setLogLevel(logger::parseLogLevel(cfg.logLevel));
        if (!cfg.logFile.empty()) {
            logger::enableFileOutput(cfg.logFile);
        }

        if (opts.command == "anonymize") {
            return runAnonymize(opts, cfg);
        }
        return runRestore(opts, cfg);
    } catch (const std::exception& ex) {
        logger::error(std::string("[main] ") + ex.what());
        return privacyguard::cli::kExitFailure;
    }
}
