#ifndef PRIVACYGUARD_CORE_SPAN_HPP
#define PRIVACYGUARD_CORE_SPAN_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace privacyguard {
namespace core {

/**
 * @struct Span
 * @brief A labeled region of the input text, [start, end) in codepoints.
 *
 * content is always re-sliced from the input text by the detector adapter,
 * never copied from a detector's own buffers.
 */
struct Span
{
    size_t start = 0;
    size_t end = 0;
    std::string label;
    std::string content;

    bool operator==(const Span &other) const
    {
        return start == other.start && end == other.end &&
               label == other.label && content == other.content;
    }
    bool operator!=(const Span &other) const { return !(*this == other); }
};

using SpanList = std::vector<Span>;

} // namespace core
} // namespace privacyguard

#endif // PRIVACYGUARD_CORE_SPAN_HPP
