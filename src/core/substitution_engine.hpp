#ifndef PRIVACYGUARD_CORE_SUBSTITUTION_ENGINE_HPP
#define PRIVACYGUARD_CORE_SUBSTITUTION_ENGINE_HPP

#include <string>
#include "core/placeholder_allocator.hpp"
#include "core/restoration_table.hpp"
#include "core/span.hpp"
#include "core/utf8_index.hpp"
#include "util/logger.hpp"

/**
 * @file substitution_engine.hpp
 * @brief Rewrites a text, replacing each accepted span with a placeholder,
 *        and records placeholder -> original content as it goes.
 *
 * One left-to-right pass: copy the gap before a span, emit its placeholder,
 * move the cursor to the span end; after the last span copy the tail.
 * Cost is O(n) in the text plus O(k) in the spans. The text is never
 * searched for span content, so repeated substrings cannot be confused.
 *
 * PRECONDITION:
 *   accepted comes from SpanReconciler::reconcile for this very text:
 *   sorted, disjoint, and inside [0, codepointCount()].
 */

namespace privacyguard {
namespace core {

class SubstitutionEngine
{
public:
    /**
     * @param text Original UTF-8 text.
     * @param utf8 Index built from text.
     * @param accepted Reconciled spans.
     */
    static AnonymizationResult substitute(const std::string &text,
                                          const Utf8Index &utf8,
                                          const SpanList &accepted)
    {
        AnonymizationResult result;
        result.sanitizedText.reserve(text.size());

        PlaceholderAllocator allocator(text);
        size_t cursor = 0; // byte offset into text
        for (const auto &span : accepted) {
            const size_t startByte = utf8.byteOffset(span.start);
            const size_t endByte = utf8.byteOffset(span.end);

            result.sanitizedText.append(text, cursor, startByte - cursor);

            std::string placeholder = allocator.next(span.label);
            result.sanitizedText += placeholder;
            // Value comes from text; span.content is not consulted.
            result.table.emplace(std::move(placeholder),
                                 text.substr(startByte, endByte - startByte));

            cursor = endByte;
        }
        result.sanitizedText.append(text, cursor, std::string::npos);

        util::logger::debug("[SubstitutionEngine] replaced " + std::to_string(accepted.size()) +
                            " spans");
        return result;
    }
};

} // namespace core
} // namespace privacyguard

#endif // PRIVACYGUARD_CORE_SUBSTITUTION_ENGINE_HPP
