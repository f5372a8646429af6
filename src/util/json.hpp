#ifndef PRIVACYGUARD_UTIL_JSON_HPP
#define PRIVACYGUARD_UTIL_JSON_HPP

#include <cctype>
#include <cstdio>
#include <map>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "core/utf8_index.hpp"

/**
 * @file json.hpp
 * @brief Reads and writes the two JSON shapes PrivacyGuard exchanges:
 *
 *   - a flat object of strings, e.g. a restoration table
 *       {"<PER_1>":"Ann","<EMAIL_1>":"ann@example.org"}
 *   - an array of flat objects, e.g. an NER inference response
 *       [{"entity_group":"PER","score":0.998,"start":8,"end":16}]
 *
 * DESIGN GOALS:
 *   - Header-only, no external JSON library.
 *   - Strings round-trip exactly: quotes, backslashes, control characters
 *     and \uXXXX escapes (surrogate pairs included) are all handled.
 *   - Scalars inside entity objects (numbers, true/false/null) are kept as
 *     their raw text; callers convert what they need.
 *   - Anything else (nesting in a flat object, trailing garbage, bad
 *     escapes) throws JsonError with the byte position.
 */

namespace privacyguard {
namespace util {
namespace json {

using FlatObject = std::map<std::string, std::string>;

/**
 * @brief Quote and escape a UTF-8 string as a JSON string literal.
 */
inline std::string quote(const std::string &raw)
{
    std::string out;
    out.reserve(raw.size() + 2);
    out.push_back('"');
    for (char ch : raw) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(ch);
                }
        }
    }
    out.push_back('"');
    return out;
}

/**
 * @brief Serialize a flat string map as a JSON object, keys in map order.
 */
inline std::string writeObject(const FlatObject &obj)
{
    std::string out = "{";
    bool first = true;
    for (const auto &kv : obj) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        out += quote(kv.first);
        out.push_back(':');
        out += quote(kv.second);
    }
    out.push_back('}');
    return out;
}

/**
 * @class Reader
 * @brief Cursor over a JSON document. Only the shapes listed above are accepted.
 */
class Reader
{
public:
    explicit Reader(const std::string &doc)
        : doc_(doc), pos_(0)
    {
    }

    FlatObject readFlatObject(bool allowScalars)
    {
        FlatObject result;
        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            ++pos_;
            return result;
        }
        while (true) {
            skipWhitespace();
            std::string key = readString();
            skipWhitespace();
            expect(':');
            skipWhitespace();

            std::string value;
            if (peek() == '"') {
                value = readString();
            } else if (allowScalars) {
                value = readScalar();
            } else {
                fail("expected string value for key '" + key + "'");
            }
            result[key] = value;

            skipWhitespace();
            char c = next();
            if (c == '}') {
                return result;
            }
            if (c != ',') {
                --pos_;
                fail("expected ',' or '}'");
            }
        }
    }

    std::vector<FlatObject> readObjectArray()
    {
        std::vector<FlatObject> result;
        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            ++pos_;
            return result;
        }
        while (true) {
            skipWhitespace();
            result.push_back(readFlatObject(true));
            skipWhitespace();
            char c = next();
            if (c == ']') {
                return result;
            }
            if (c != ',') {
                --pos_;
                fail("expected ',' or ']'");
            }
        }
    }

    void skipWhitespace()
    {
        while (pos_ < doc_.size() && std::isspace(static_cast<unsigned char>(doc_[pos_]))) {
            ++pos_;
        }
    }

    char peek() const
    {
        return pos_ < doc_.size() ? doc_[pos_] : '\0';
    }

    bool atEnd() const { return pos_ >= doc_.size(); }

    [[noreturn]] void fail(const std::string &msg) const
    {
        throw JsonError("json: " + msg + " at byte " + std::to_string(pos_));
    }

private:
    char next()
    {
        if (pos_ >= doc_.size()) {
            fail("unexpected end of input");
        }
        return doc_[pos_++];
    }

    void expect(char c)
    {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    unsigned readHex4()
    {
        if (pos_ + 4 > doc_.size()) {
            fail("truncated \\u escape");
        }
        unsigned value = 0;
        for (int i = 0; i < 4; ++i) {
            char c = doc_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<unsigned>(c - 'A' + 10);
            else fail("bad hex digit in \\u escape");
        }
        return value;
    }

    std::string readString()
    {
        expect('"');
        std::string out;
        while (true) {
            char c = next();
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                --pos_;
                fail("unescaped control character in string");
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            char esc = next();
            switch (esc) {
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/'); break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u': {
                    char32_t cp = readHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (next() != '\\' || next() != 'u') {
                            fail("unpaired high surrogate");
                        }
                        unsigned low = readHex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            fail("invalid low surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("unpaired low surrogate");
                    }
                    core::appendUtf8(out, cp);
                    break;
                }
                default:
                    fail(std::string("invalid escape '\\") + esc + "'");
            }
        }
    }

    // Numbers and literals, returned as written.
    std::string readScalar()
    {
        size_t start = pos_;
        while (pos_ < doc_.size()) {
            char c = doc_[pos_];
            if (c == ',' || c == '}' || c == ']' || std::isspace(static_cast<unsigned char>(c))) {
                break;
            }
            if (c == '{' || c == '[' || c == '"') {
                fail("nested value not supported");
            }
            ++pos_;
        }
        if (pos_ == start) {
            fail("missing value");
        }
        return doc_.substr(start, pos_ - start);
    }

    const std::string &doc_;
    size_t pos_;
};

/**
 * @brief Parse a JSON object whose values are all strings.
 * @throw JsonError on any other shape.
 */
inline FlatObject parseStringObject(const std::string &doc)
{
    Reader reader(doc);
    reader.skipWhitespace();
    FlatObject obj = reader.readFlatObject(false);
    reader.skipWhitespace();
    if (!reader.atEnd()) {
        reader.fail("trailing characters");
    }
    return obj;
}

/**
 * @brief Parse a JSON array of flat objects (string or scalar values).
 * @throw JsonError on any other shape.
 */
inline std::vector<FlatObject> parseObjectArray(const std::string &doc)
{
    Reader reader(doc);
    reader.skipWhitespace();
    std::vector<FlatObject> arr = reader.readObjectArray();
    reader.skipWhitespace();
    if (!reader.atEnd()) {
        reader.fail("trailing characters");
    }
    return arr;
}

} // namespace json
} // namespace util
} // namespace privacyguard

#endif // PRIVACYGUARD_UTIL_JSON_HPP
