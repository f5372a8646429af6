#ifndef PRIVACYGUARD_CONFIG_GUARD_CONFIG_HPP
#define PRIVACYGUARD_CONFIG_GUARD_CONFIG_HPP

#include <cstdint>
#include <map>
#include <string>

/**
 * @file guard_config.hpp
 * @brief Runtime settings for a PrivacyGuard instance and the CLI.
 *
 * USAGE:
 *   - Populate manually, or through util/config_parser.hpp from a key=value file.
 *   - PrivacyGuard::fromConfig() turns it into a detector list.
 */

namespace privacyguard {
namespace config {

/**
 * @struct GuardConfig
 * @brief Holds:
 *   - defaultLanguage: language used when a caller's language has no NER model.
 *   - regexEnabled / nerEnabled: which detectors run, regex first.
 *   - nerEndpoints: language -> HTTP inference URL for the NER model.
 *   - nerTimeoutSeconds: per-request timeout towards the NER endpoint.
 *   - nerMinScore: entities scoring below this are ignored.
 *   - vaultPath: SQLite file for stored restoration tables.
 *   - logLevel / logFile: logger setup; empty logFile means console only.
 *   - workerThreads: pool size for batch anonymization, 0 = hardware concurrency.
 */
struct GuardConfig
{
    GuardConfig()
        : defaultLanguage("en"),
          regexEnabled(true),
          nerEnabled(false),
          nerTimeoutSeconds(30),
          nerMinScore(0.0),
          vaultPath("./privacyguard_vault.sqlite"),
          logLevel("INFO"),
          workerThreads(0)
    {
        nerEndpoints["en"] = "http://127.0.0.1:8080/models/dslim/bert-base-NER";
        nerEndpoints["fr"] = "http://127.0.0.1:8080/models/Jean-Baptiste/camembert-ner";
    }

    std::string defaultLanguage;

    bool regexEnabled;

    bool nerEnabled;

    std::map<std::string, std::string> nerEndpoints;

    uint32_t nerTimeoutSeconds;

    double nerMinScore;

    std::string vaultPath;

    std::string logLevel;

    std::string logFile;

    uint32_t workerThreads;
};

} // namespace config
} // namespace privacyguard

#endif // PRIVACYGUARD_CONFIG_GUARD_CONFIG_HPP
