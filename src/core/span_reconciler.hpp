#ifndef PRIVACYGUARD_CORE_SPAN_RECONCILER_HPP
#define PRIVACYGUARD_CORE_SPAN_RECONCILER_HPP

#include <algorithm>
#include <string>
#include <vector>
#include "core/span.hpp"
#include "util/logger.hpp"

/**
 * @file span_reconciler.hpp
 * @brief Merges the span streams of every detector into one ordered,
 *        non-overlapping sequence.
 *
 * RULE:
 *   - Spans outside [0, textLength] or with start >= end are malformed and
 *     dropped with a WARN before anything else looks at them.
 *   - The rest are stable-sorted by start. Ties keep their input order, so
 *     the detector enumerated first wins a shared start.
 *   - A left-to-right scan accepts a span iff it starts at or after the end
 *     of the last accepted span. Overlapping spans are dropped silently.
 *
 * This is leftmost-first, not longest-match: a short span that starts
 * earlier beats a longer one that starts later, and a nested span always
 * loses to the span enclosing it.
 *
 * USAGE:
 *   @code
 *   SpanList all = regexSpans;
 *   all.insert(all.end(), nerSpans.begin(), nerSpans.end());
 *   SpanList accepted = SpanReconciler::reconcile(std::move(all), utf8.codepointCount());
 *   @endcode
 */

namespace privacyguard {
namespace core {

class SpanReconciler
{
public:
    /**
     * @param spans All detector output, concatenated in detector order.
     * @param textLength Length of the source text in codepoints.
     * @return Accepted spans, strictly increasing start, pairwise disjoint.
     */
    static SpanList reconcile(SpanList spans, size_t textLength)
    {
        SpanList valid = dropMalformed(std::move(spans), textLength);

        std::stable_sort(valid.begin(), valid.end(),
                         [](const Span &a, const Span &b) { return a.start < b.start; });

        SpanList accepted;
        accepted.reserve(valid.size());
        // Every valid start is >= 0, so 0 stands in for "before the text".
        size_t lastEnd = 0;
        for (auto &span : valid) {
            if (span.start >= lastEnd) {
                lastEnd = span.end;
                accepted.push_back(std::move(span));
            }
        }

        util::logger::debug("[SpanReconciler] accepted " + std::to_string(accepted.size()) +
                            " of " + std::to_string(valid.size()) + " spans");
        return accepted;
    }

    static bool isWellFormed(const Span &span, size_t textLength)
    {
        return span.start < span.end && span.end <= textLength;
    }

private:
    static SpanList dropMalformed(SpanList spans, size_t textLength)
    {
        SpanList valid;
        valid.reserve(spans.size());
        for (auto &span : spans) {
            if (!isWellFormed(span, textLength)) {
                util::logger::warn("[SpanReconciler] dropping malformed span label=" + span.label +
                                   " [" + std::to_string(span.start) + ", " +
                                   std::to_string(span.end) + ") for text of length " +
                                   std::to_string(textLength));
                continue;
            }
            valid.push_back(std::move(span));
        }
        return valid;
    }
};

} // namespace core
} // namespace privacyguard

#endif // PRIVACYGUARD_CORE_SPAN_RECONCILER_HPP
