#ifndef PRIVACYGUARD_CORE_PLACEHOLDER_ALLOCATOR_HPP
#define PRIVACYGUARD_CORE_PLACEHOLDER_ALLOCATOR_HPP

#include <string>
#include <unordered_map>
#include <unordered_set>

namespace privacyguard {
namespace core {

/*
  PlaceholderAllocator
  --------------------------------
  Hands out <LABEL_N> tokens, N counting from 1 per label in the order
  next() is called. One allocator lives for exactly one anonymize call.

  Labels are used verbatim; casing is the detector's business.

  A counter value is skipped when its token already appears literally in
  the source text, otherwise restore() could not tell the two apart. For
  ordinary input nothing is skipped and the sequence is 1, 2, 3, ...
*/

class PlaceholderAllocator
{
public:
    PlaceholderAllocator() = default;

    // Collects every "<...>" run of the source text once, so the collision
    // check stays O(1) per allocation.
    explicit PlaceholderAllocator(const std::string &sourceText)
    {
        size_t open = sourceText.find('<');
        while (open != std::string::npos) {
            size_t next = sourceText.find_first_of("<>", open + 1);
            if (next == std::string::npos) {
                break;
            }
            if (sourceText[next] == '>') {
                m_reserved.insert(sourceText.substr(open, next - open + 1));
                open = sourceText.find('<', next + 1);
            } else {
                open = next;
            }
        }
    }

    std::string next(const std::string &label)
    {
        size_t &count = m_counters[label];
        std::string token;
        do {
            ++count;
            token = "<" + label + "_" + std::to_string(count) + ">";
        } while (m_reserved.count(token) != 0);
        return token;
    }

    // Number of tokens issued so far for label (skipped values included).
    size_t issued(const std::string &label) const
    {
        auto it = m_counters.find(label);
        return it == m_counters.end() ? 0 : it->second;
    }

private:
    std::unordered_map<std::string, size_t> m_counters;
    std::unordered_set<std::string> m_reserved;
};

} // namespace core
} // namespace privacyguard

#endif // PRIVACYGUARD_CORE_PLACEHOLDER_ALLOCATOR_HPP
