#ifndef PRIVACYGUARD_CORE_RESTORATION_TABLE_HPP
#define PRIVACYGUARD_CORE_RESTORATION_TABLE_HPP

#include <map>
#include <string>
#include "util/json.hpp"

namespace privacyguard {
namespace core {

// placeholder -> original content. Created per anonymize call, owned by the
// caller, never merged with another call's table.
using RestorationTable = std::map<std::string, std::string>;

/**
 * @struct AnonymizationResult
 * @brief Output of one anonymize call.
 */
struct AnonymizationResult
{
    std::string sanitizedText;
    RestorationTable table;
};

// Persisted form: {"<PER_1>":"Ann", ...}
inline std::string tableToJson(const RestorationTable &table)
{
    return util::json::writeObject(table);
}

/**
 * @throw JsonError if doc is not a flat object of strings.
 */
inline RestorationTable tableFromJson(const std::string &doc)
{
    return util::json::parseStringObject(doc);
}

} // namespace core
} // namespace privacyguard

#endif // PRIVACYGUARD_CORE_RESTORATION_TABLE_HPP
