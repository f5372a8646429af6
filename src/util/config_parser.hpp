#ifndef PRIVACYGUARD_UTIL_CONFIG_PARSER_HPP
#define PRIVACYGUARD_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include "guard_config.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a plain "key=value" file into a GuardConfig.
 *
 * FORMAT:
 *   # comment
 *   defaultLanguage = en
 *   nerEnabled      = true
 *   nerEndpoint.fr  = http://127.0.0.1:8080/models/Jean-Baptiste/camembert-ner
 *   nerMinScore     = 0.5
 *
 * A missing file is not an error: a warning is logged and the defaults stay.
 * Lines without '=' and values that do not parse throw ConfigError.
 * Unknown keys are logged and skipped.
 *
 * USAGE:
 *   @code
 *   privacyguard::config::GuardConfig cfg;
 *   privacyguard::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("privacyguard.conf");
 *   @endcode
 */

namespace privacyguard {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(config::GuardConfig &guardConfig)
        : config_(guardConfig)
    {
    }

    /**
     * @return false if the file does not exist (defaults kept), true once parsed.
     * @throw ConfigError on a malformed line or value.
     */
    bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("[ConfigParser] File not found, using defaults: " + filepath);
            return false;
        }

        logger::info("[ConfigParser] Loading config from " + filepath);

        std::string line;
        size_t lineNo = 0;
        while (std::getline(inFile, line)) {
            ++lineNo;
            parseLine(line, lineNo);
        }
        return true;
    }

    /**
     * @brief Apply a single "key=value" line; blank lines and comments are skipped.
     * @throw ConfigError on a malformed line or value.
     */
    void parseLine(std::string line, size_t lineNo = 0)
    {
        trim(line);
        if (line.empty() || line[0] == '#') {
            return;
        }

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            throw ConfigError("ConfigParser: line " + std::to_string(lineNo) + " has no '=': " + line);
        }
        std::string key = line.substr(0, pos);
        std::string val = line.substr(pos + 1);
        trim(key);
        trim(val);
        applyKeyValue(key, val);
    }

private:
    void applyKeyValue(const std::string &key, const std::string &val)
    {
        static const std::string endpointPrefix = "nerEndpoint.";

        if (key == "defaultLanguage") {
            if (val.empty()) {
                throw ConfigError("ConfigParser: defaultLanguage must not be empty");
            }
            config_.defaultLanguage = val;
        }
        else if (key == "regexEnabled") {
            config_.regexEnabled = parseBool(key, val);
        }
        else if (key == "nerEnabled") {
            config_.nerEnabled = parseBool(key, val);
        }
        else if (key.compare(0, endpointPrefix.size(), endpointPrefix) == 0) {
            std::string lang = key.substr(endpointPrefix.size());
            if (lang.empty()) {
                throw ConfigError("ConfigParser: nerEndpoint needs a language suffix");
            }
            if (val.empty()) {
                config_.nerEndpoints.erase(lang);
            } else {
                config_.nerEndpoints[lang] = val;
            }
        }
        else if (key == "nerTimeoutSeconds") {
            config_.nerTimeoutSeconds = static_cast<uint32_t>(parseUInt(key, val, std::numeric_limits<uint32_t>::max()));
        }
        else if (key == "nerMinScore") {
            config_.nerMinScore = parseDouble(key, val);
        }
        else if (key == "vaultPath") {
            config_.vaultPath = val;
        }
        else if (key == "logLevel") {
            try {
                logger::parseLogLevel(val);
            } catch (const std::invalid_argument &ex) {
                throw ConfigError(std::string("ConfigParser: ") + ex.what());
            }
            config_.logLevel = val;
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else if (key == "workerThreads") {
            config_.workerThreads = static_cast<uint32_t>(parseUInt(key, val, 1024));
        }
        else {
            logger::warn("[ConfigParser] Unrecognized key '" + key + "'");
            return;
        }
        logger::debug("[ConfigParser] " + key + " set to " + val);
    }

    static void trim(std::string &s)
    {
        static const char *whitespace = " \t\r\n";
        auto first = s.find_first_not_of(whitespace);
        if (first == std::string::npos) {
            s.clear();
            return;
        }
        auto last = s.find_last_not_of(whitespace);
        s = s.substr(first, last - first + 1);
    }

    static bool parseBool(const std::string &key, const std::string &val)
    {
        if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
        if (val == "false" || val == "0" || val == "no" || val == "off") return false;
        throw ConfigError("ConfigParser: " + key + " expects a boolean, got '" + val + "'");
    }

    static uint64_t parseUInt(const std::string &key, const std::string &val, uint64_t max)
    {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw ConfigError("ConfigParser: " + key + " expects an unsigned integer, got '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size() || n > max) {
                throw ConfigError("ConfigParser: " + key + " out of range or not numeric: '" + val + "'");
            }
            return n;
        }
        catch (const std::logic_error &ex) {
            throw ConfigError("ConfigParser: " + key + " parse failed on '" + val + "': " + ex.what());
        }
    }

    static double parseDouble(const std::string &key, const std::string &val)
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw ConfigError("ConfigParser: " + key + " has a non-numeric suffix: '" + val + "'");
            }
            return d;
        }
        catch (const std::logic_error &ex) {
            throw ConfigError("ConfigParser: " + key + " parse failed on '" + val + "': " + ex.what());
        }
    }

    config::GuardConfig &config_;
};

} // namespace util
} // namespace privacyguard

#endif // PRIVACYGUARD_UTIL_CONFIG_PARSER_HPP
