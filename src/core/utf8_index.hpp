#ifndef PRIVACYGUARD_CORE_UTF8_INDEX_HPP
#define PRIVACYGUARD_CORE_UTF8_INDEX_HPP

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors.hpp"

/**
 * @file utf8_index.hpp
 * @brief Maps between byte offsets and codepoint (Unicode scalar) offsets
 *        of a UTF-8 string.
 *
 * Span offsets are codepoint indices everywhere in PrivacyGuard, while
 * std::regex and std::string work on bytes. Building an index is O(n);
 * each lookup afterwards is O(1) (codepoint -> byte) or O(log n)
 * (byte -> codepoint).
 *
 * USAGE:
 *   @code
 *   Utf8Index idx("Zo\xC3\xAB ok");   // "Zoë ok"
 *   idx.codepointCount();            // 6
 *   idx.byteOffset(4);               // 5
 *   idx.codepointAt(5);              // 4
 *   idx.codepointAt(3);              // nullopt, inside 'ë'
 *   @endcode
 */

namespace privacyguard {
namespace core {

/**
 * @brief Decode one codepoint starting at text[pos].
 * @return The byte length of the sequence, or 0 if it is not valid UTF-8
 *         (overlong forms, surrogates and values above U+10FFFF are invalid).
 */
inline size_t decodeUtf8(const std::string &text, size_t pos, char32_t &cp)
{
    const size_t n = text.size();
    const auto byteAt = [&text](size_t i) { return static_cast<unsigned char>(text[i]); };
    const unsigned char lead = byteAt(pos);

    size_t len;
    char32_t min;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2; cp = lead & 0x1F; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3; cp = lead & 0x0F; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4; cp = lead & 0x07; min = 0x10000;
    } else {
        return 0;
    }

    if (pos + len > n) {
        return 0;
    }
    for (size_t i = 1; i < len; ++i) {
        unsigned char c = byteAt(pos + i);
        if ((c & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return len;
}

/**
 * @brief Append the UTF-8 encoding of cp to out.
 * @throw GuardError on surrogates or values above U+10FFFF.
 */
inline void appendUtf8(std::string &out, char32_t cp)
{
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        throw GuardError("appendUtf8: invalid codepoint");
    }
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/**
 * @class Utf8Index
 * @brief Byte offset of every codepoint boundary of one string.
 *
 * The string is not copied; the index only stays meaningful for the text
 * it was built from.
 */
class Utf8Index
{
public:
    /**
     * @throw GuardError if text is not valid UTF-8.
     */
    explicit Utf8Index(const std::string &text)
    {
        m_boundaries.reserve(text.size() + 1);
        size_t pos = 0;
        while (pos < text.size()) {
            char32_t cp;
            size_t len = decodeUtf8(text, pos, cp);
            if (len == 0) {
                throw GuardError("Utf8Index: invalid UTF-8 at byte " + std::to_string(pos));
            }
            m_boundaries.push_back(pos);
            pos += len;
        }
        m_boundaries.push_back(text.size());
    }

    size_t codepointCount() const { return m_boundaries.size() - 1; }

    size_t byteCount() const { return m_boundaries.back(); }

    /**
     * @brief Byte offset of codepoint index cp; cp == codepointCount() gives the end.
     * @throw std::out_of_range if cp is past the end.
     */
    size_t byteOffset(size_t cp) const
    {
        return m_boundaries.at(cp);
    }

    /**
     * @brief Codepoint index that starts at the given byte offset.
     * @return nullopt when the byte offset is out of range or falls inside a
     *         multi-byte sequence.
     */
    std::optional<size_t> codepointAt(size_t byte) const
    {
        auto it = std::lower_bound(m_boundaries.begin(), m_boundaries.end(), byte);
        if (it == m_boundaries.end() || *it != byte) {
            return std::nullopt;
        }
        return static_cast<size_t>(it - m_boundaries.begin());
    }

    /**
     * @brief Bytes of the half-open codepoint range [start, end).
     */
    std::string slice(const std::string &text, size_t start, size_t end) const
    {
        size_t b = byteOffset(start);
        return text.substr(b, byteOffset(end) - b);
    }

private:
    std::vector<size_t> m_boundaries;
};

} // namespace core
} // namespace privacyguard

#endif // PRIVACYGUARD_CORE_UTF8_INDEX_HPP
