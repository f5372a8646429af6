#ifndef PRIVACYGUARD_DETECT_NER_DETECTOR_HPP
#define PRIVACYGUARD_DETECT_NER_DETECTOR_HPP

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "core/errors.hpp"
#include "core/utf8_index.hpp"
#include "detect/detector.hpp"
#include "detect/ner_backend.hpp"
#include "util/logger.hpp"

/**
 * @file ner_detector.hpp
 * @brief Model-based detector for unstructured entities (persons, places, organisations).
 *
 * DESIGN GOALS:
 *   - One NerBackend per language; "en" is the usual default.
 *   - An unknown language is not fatal: a warning is logged and the default
 *     language's backend is used instead.
 *   - Raw entity offsets are converted to codepoints, then content is sliced
 *     from the caller's text. What the model thinks the word was is ignored,
 *     since tokenizers lowercase, strip or merge whitespace.
 *   - Entities scoring below the minimum score are skipped.
 *   - Offsets past the end of the text are passed on unchanged (with empty
 *     content) so that the reconciler reports and drops them.
 *
 * USAGE EXAMPLE:
 *   @code
 *   NerDetector ner("en");
 *   ner.setBackend("en", std::make_shared<HttpNerBackend>("http://127.0.0.1:8080/models/en"));
 *   ner.setBackend("fr", std::make_shared<HttpNerBackend>("http://127.0.0.1:8080/models/fr"));
 *   auto spans = ner.detect("Jean habite Paris.", "fr");
 *   @endcode
 */

namespace privacyguard {
namespace detect {

class NerDetector : public Detector
{
public:
    explicit NerDetector(const std::string &defaultLanguage = "en", double minScore = 0.0)
        : m_defaultLanguage(defaultLanguage), m_minScore(minScore)
    {
    }

    /**
     * @throw std::invalid_argument if backend is null.
     */
    void setBackend(const std::string &language, std::shared_ptr<const NerBackend> backend)
    {
        if (!backend) {
            throw std::invalid_argument("NerDetector: null backend for language '" + language + "'");
        }
        m_backends[language] = std::move(backend);
    }

    bool supports(const std::string &language) const
    {
        return m_backends.count(language) != 0;
    }

    const std::string &defaultLanguage() const { return m_defaultLanguage; }

    std::string name() const override { return "ner"; }

    /**
     * @throw DetectorFailure if there is no backend for the default language.
     * @throw whatever the backend throws on inference failure.
     */
    core::SpanList detect(const std::string &text, const std::string &language) const override
    {
        const NerBackend &backend = resolve(language);
        const auto entities = backend.infer(text);

        core::Utf8Index utf8(text);
        core::SpanList spans;
        spans.reserve(entities.size());
        for (const auto &entity : entities) {
            if (entity.score < m_minScore) {
                continue;
            }
            auto span = toSpan(entity, backend.offsetUnit(), text, utf8);
            if (span) {
                spans.push_back(std::move(*span));
            }
        }

        util::logger::debug("[NerDetector] " + std::to_string(spans.size()) + " entities from " +
                            backend.describe());
        return spans;
    }

private:
    const NerBackend &resolve(const std::string &language) const
    {
        auto it = m_backends.find(language);
        if (it == m_backends.end()) {
            util::logger::warn("[NerDetector] Language '" + language +
                               "' not supported. Defaulting to '" + m_defaultLanguage + "'.");
            it = m_backends.find(m_defaultLanguage);
        }
        if (it == m_backends.end()) {
            throw DetectorFailure(name(), "no NER model for default language '" + m_defaultLanguage + "'");
        }
        return *it->second;
    }

    static std::optional<core::Span> toSpan(const RawEntity &entity,
                                            OffsetUnit unit,
                                            const std::string &text,
                                            const core::Utf8Index &utf8)
    {
        size_t start = entity.start;
        size_t end = entity.end;

        if (unit == OffsetUnit::Byte) {
            if (end > utf8.byteCount() || start >= end) {
                // Out of range in codepoints too; the reconciler drops it.
                return core::Span{start, end, entity.label, std::string()};
            }
            auto s = utf8.codepointAt(start);
            auto e = utf8.codepointAt(end);
            if (!s || !e) {
                util::logger::warn("[NerDetector] entity " + entity.label +
                                   " has a byte offset inside a UTF-8 sequence, skipped");
                return std::nullopt;
            }
            start = *s;
            end = *e;
        }

        if (start >= end || end > utf8.codepointCount()) {
            return core::Span{start, end, entity.label, std::string()};
        }
        return core::Span{start, end, entity.label, utf8.slice(text, start, end)};
    }

    std::string m_defaultLanguage;
    double m_minScore;
    std::map<std::string, std::shared_ptr<const NerBackend>> m_backends;
};

} // namespace detect
} // namespace privacyguard

#endif // PRIVACYGUARD_DETECT_NER_DETECTOR_HPP
