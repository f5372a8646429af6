#ifndef PRIVACYGUARD_DETECT_REGEX_DETECTOR_HPP
#define PRIVACYGUARD_DETECT_REGEX_DETECTOR_HPP

#include <cctype>
#include <regex>
#include <string>
#include <vector>
#include "core/utf8_index.hpp"
#include "detect/detector.hpp"
#include "util/logger.hpp"

/**
 * @file regex_detector.hpp
 * @brief Pattern-based detector for structured PII (emails, phone numbers, IBANs).
 *
 * DESIGN GOALS:
 *   - Patterns run in registration order, each yielding its matches left to
 *     right. The reconciler breaks start-position ties by that order.
 *   - std::regex works on UTF-8 bytes; every match is converted to codepoint
 *     offsets before it leaves the detector.
 *   - A pattern can require that its match is not preceded, or not
 *     followed, by a word character. std::regex has no lookbehind and its
 *     \b only knows ASCII, so both edges are checked after the fact on the
 *     neighbouring codepoint and a rejected search resumes one byte further on.
 *   - Quantifiers in the default patterns are bounded. libstdc++ matches
 *     recursively, so an unbounded repeat over a long run of input (a
 *     base64 blob, a long URL) would exhaust the stack. Patterns given to
 *     addPattern() should be bounded the same way.
 *   - The language argument is ignored; the patterns are language-neutral.
 *
 * USAGE EXAMPLE:
 *   @code
 *   privacyguard::detect::RegexDetector regex = RegexDetector::withDefaultPatterns();
 *   regex.addPattern("SSN", R"(\b\d{3}-\d{2}-\d{4}\b)");
 *   auto spans = regex.detect("mail ann@example.org", "en");
 *   // spans[0] = {5, 20, "EMAIL", "ann@example.org"}
 *   @endcode
 */

namespace privacyguard {
namespace detect {

class RegexDetector : public Detector
{
public:
    RegexDetector() = default;

    /**
     * @brief EMAIL, PHONE and IBAN, in that order.
     */
    static RegexDetector withDefaultPatterns()
    {
        RegexDetector detector;
        // RFC 5321 limits: 64 for the local part, 255 for the domain, 63 per label.
        detector.addPattern("EMAIL", R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,255}\.[A-Z|a-z]{2,63}\b)",
                            true, true);
        // Country code, optional (area), then two digit groups.
        detector.addPattern("PHONE",
                            R"((?:\+?\d{1,3}[-.\s]?)?\(?\d{2,4}\)?[-.\s]?\d{2,4}[-.\s]?\d{2,4}\b)",
                            true, true);
        detector.addPattern("IBAN", R"(\b[A-Z]{2}\d{2}[A-Z0-9]{4}\d{7}[A-Z0-9]{0,16}\b)", true, true);
        return detector;
    }

    /**
     * @brief Register a pattern. Not thread-safe against concurrent detect().
     * @param label Label given to every match.
     * @param pattern ECMAScript regular expression.
     * @param notAfterWordChar Reject matches directly preceded by a word character.
     * @param notBeforeWordChar Reject matches directly followed by a word character.
     * @throw std::regex_error if the pattern does not compile.
     */
    void addPattern(const std::string &label,
                    const std::string &pattern,
                    bool notAfterWordChar = false,
                    bool notBeforeWordChar = false)
    {
        m_patterns.push_back(Pattern{label, std::regex(pattern, std::regex::ECMAScript),
                                     notAfterWordChar, notBeforeWordChar});
    }

    size_t patternCount() const { return m_patterns.size(); }

    std::string name() const override { return "regex"; }

    core::SpanList detect(const std::string &text, const std::string &) const override
    {
        core::Utf8Index utf8(text);
        core::SpanList spans;
        for (const auto &pattern : m_patterns) {
            collectMatches(pattern, text, utf8, spans);
        }
        util::logger::debug("[RegexDetector] " + std::to_string(spans.size()) + " matches");
        return spans;
    }

private:
    struct Pattern
    {
        std::string label;
        std::regex regex;
        bool notAfterWordChar;
        bool notBeforeWordChar;
    };

    // Approximates Unicode word characters without a Unicode database:
    // anything outside ASCII is a word character except Latin-1 punctuation
    // and symbols (NBSP, guillemets, multiplication and division signs),
    // U+2000..U+2BFF and CJK punctuation.
    static bool isWordCodepoint(char32_t cp)
    {
        if (cp < 0x80) {
            return std::isalnum(static_cast<unsigned char>(cp)) || cp == '_';
        }
        if (cp <= 0xBF || cp == 0xD7 || cp == 0xF7) {
            return false;
        }
        if ((cp >= 0x2000 && cp <= 0x2BFF) || (cp >= 0x3000 && cp <= 0x303F)) {
            return false;
        }
        return true;
    }

    static bool isWordAt(const std::string &text, const core::Utf8Index &utf8, size_t cp)
    {
        char32_t value = 0;
        if (core::decodeUtf8(text, utf8.byteOffset(cp), value) == 0) {
            return false;
        }
        return isWordCodepoint(value);
    }

    static void collectMatches(const Pattern &pattern,
                               const std::string &text,
                               const core::Utf8Index &utf8,
                               core::SpanList &out)
    {
        const auto begin = text.cbegin();
        const auto end = text.cend();
        auto cursor = begin;
        std::smatch match;

        while (cursor != end) {
            auto flags = std::regex_constants::match_default;
            if (cursor != begin) {
                flags |= std::regex_constants::match_prev_avail;
            }
            if (!std::regex_search(cursor, end, match, pattern.regex, flags)) {
                break;
            }

            const size_t startByte = static_cast<size_t>(match[0].first - begin);
            const size_t endByte = static_cast<size_t>(match[0].second - begin);

            if (endByte == startByte) {
                cursor = match[0].first + 1;
                continue;
            }
            auto start = utf8.codepointAt(startByte);
            auto stop = utf8.codepointAt(endByte);
            if (!start || !stop) {
                util::logger::warn("[RegexDetector] pattern " + pattern.label +
                                   " matched inside a UTF-8 sequence at byte " +
                                   std::to_string(startByte) + ", skipped");
                cursor = match[0].second;
                continue;
            }
            if ((pattern.notAfterWordChar && *start > 0 && isWordAt(text, utf8, *start - 1)) ||
                (pattern.notBeforeWordChar && *stop < utf8.codepointCount() && isWordAt(text, utf8, *stop))) {
                cursor = match[0].first + 1;
                continue;
            }

            out.push_back(core::Span{*start, *stop, pattern.label,
                                     text.substr(startByte, endByte - startByte)});
            cursor = match[0].second;
        }
    }

    std::vector<Pattern> m_patterns;
};

} // namespace detect
} // namespace privacyguard

#endif // PRIVACYGUARD_DETECT_REGEX_DETECTOR_HPP
