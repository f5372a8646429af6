#ifndef PRIVACYGUARD_CORE_RESTORER_HPP
#define PRIVACYGUARD_CORE_RESTORER_HPP

#include <map>
#include <string>
#include <vector>
#include "core/restoration_table.hpp"
#include "util/logger.hpp"

/**
 * @file restorer.hpp
 * @brief Inverts a substitution: every placeholder of the table that occurs
 *        in the sanitized text is replaced by its original content.
 *
 * DESIGN:
 *   - The table keys are loaded into a byte trie.
 *   - The sanitized text is scanned once. At each position the longest key
 *     starting there wins, so <PER_10> is never cut short by <PER_1>.
 *   - Replacement content goes straight to the output and is never scanned
 *     again: a restored value that happens to look like a placeholder
 *     stays as it is.
 *   - Text that matches no key is copied unchanged. A placeholder missing
 *     from the table stays literally in the output, and table keys absent
 *     from the text are ignored. Neither case is an error.
 *
 * USAGE:
 *   @code
 *   Restorer restorer(table);
 *   std::string original = restorer.restore(sanitized);
 *   // or one-shot:
 *   std::string original2 = Restorer::restore(sanitized, table);
 *   @endcode
 */

namespace privacyguard {
namespace core {

class Restorer
{
public:
    explicit Restorer(const RestorationTable &table)
        : m_nodes(1)
    {
        for (const auto &kv : table) {
            if (kv.first.empty()) {
                util::logger::debug("[Restorer] ignoring empty placeholder key");
                continue;
            }
            insert(kv.first, kv.second);
        }
    }

    std::string restore(const std::string &sanitized) const
    {
        std::string out;
        out.reserve(sanitized.size());

        size_t pos = 0;
        size_t replaced = 0;
        while (pos < sanitized.size()) {
            size_t matchLen = 0;
            const std::string *value = longestMatch(sanitized, pos, matchLen);
            if (value) {
                out += *value;
                pos += matchLen;
                ++replaced;
            } else {
                out.push_back(sanitized[pos]);
                ++pos;
            }
        }

        util::logger::debug("[Restorer] restored " + std::to_string(replaced) + " placeholders");
        return out;
    }

    static std::string restore(const std::string &sanitized, const RestorationTable &table)
    {
        return Restorer(table).restore(sanitized);
    }

private:
    static constexpr size_t kNoValue = static_cast<size_t>(-1);

    struct Node
    {
        std::map<unsigned char, size_t> children;
        size_t valueIndex = kNoValue; // set when a key ends here
    };

    void insert(const std::string &key, const std::string &value)
    {
        size_t node = 0;
        for (char ch : key) {
            unsigned char c = static_cast<unsigned char>(ch);
            auto it = m_nodes[node].children.find(c);
            if (it == m_nodes[node].children.end()) {
                m_nodes.emplace_back();
                it = m_nodes[node].children.emplace(c, m_nodes.size() - 1).first;
            }
            node = it->second;
        }
        m_values.push_back(value);
        m_nodes[node].valueIndex = m_values.size() - 1;
    }

    const std::string *longestMatch(const std::string &text, size_t pos, size_t &matchLen) const
    {
        const std::string *best = nullptr;
        size_t node = 0;
        for (size_t i = pos; i < text.size(); ++i) {
            const auto &children = m_nodes[node].children;
            auto it = children.find(static_cast<unsigned char>(text[i]));
            if (it == children.end()) {
                break;
            }
            node = it->second;
            if (m_nodes[node].valueIndex != kNoValue) {
                best = &m_values[m_nodes[node].valueIndex];
                matchLen = i - pos + 1;
            }
        }
        return best;
    }

    std::vector<Node> m_nodes;
    std::vector<std::string> m_values;
};

} // namespace core
} // namespace privacyguard

#endif // PRIVACYGUARD_CORE_RESTORER_HPP
