#ifndef PRIVACYGUARD_GUARD_PRIVACY_GUARD_HPP
#define PRIVACYGUARD_GUARD_PRIVACY_GUARD_HPP

#include <algorithm>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "guard_config.hpp"
#include "core/errors.hpp"
#include "core/restoration_table.hpp"
#include "core/restorer.hpp"
#include "core/span_reconciler.hpp"
#include "core/substitution_engine.hpp"
#include "core/utf8_index.hpp"
#include "detect/detector.hpp"
#include "detect/http_ner_backend.hpp"
#include "detect/ner_detector.hpp"
#include "detect/regex_detector.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

/**
 * @file privacy_guard.hpp
 * @brief Reversible redaction of sensitive spans in text.
 *
 * PIPELINE (per anonymize call):
 *   1. Every detector runs on the full text, in registration order. Their
 *      outputs are fully collected before anything else happens.
 *   2. SpanReconciler turns the concatenated spans into a sorted,
 *      non-overlapping set.
 *   3. SubstitutionEngine replaces the accepted spans with <LABEL_N>
 *      placeholders and builds the restoration table in the same pass.
 *
 * restore() needs only the sanitized text and the table; no detector is
 * involved.
 *
 * ERRORS:
 *   - Any detector exception aborts the call as DetectorFailure; no partial
 *     result is returned.
 *   - Text that is not valid UTF-8 is rejected with GuardError.
 *
 * THREADING:
 *   anonymize/restore keep all state on the stack, so one PrivacyGuard can
 *   serve many threads once its detector list is set up.
 *
 * USAGE EXAMPLE:
 *   @code
 *   privacyguard::PrivacyGuard guard;
 *   guard.addDetector(std::make_shared<detect::RegexDetector>(detect::RegexDetector::withDefaultPatterns()));
 *   auto result = guard.anonymize("Mail ann@example.org", "en");
 *   // result.sanitizedText == "Mail <EMAIL_1>"
 *   std::string back = guard.restore(result.sanitizedText, result.table);
 *   @endcode
 */

namespace privacyguard {

class PrivacyGuard
{
public:
    explicit PrivacyGuard(size_t workerThreads = 0)
        : m_workerThreads(workerThreads)
    {
    }

    /**
     * @brief Build the detector list described by a configuration:
     *        regex first (if enabled), then NER (if enabled).
     */
    static PrivacyGuard fromConfig(const config::GuardConfig &cfg)
    {
        util::logger::info("[PrivacyGuard] Initializing...");
        PrivacyGuard guard(cfg.workerThreads);

        if (cfg.regexEnabled) {
            guard.addDetector(std::make_shared<detect::RegexDetector>(
                detect::RegexDetector::withDefaultPatterns()));
        }
        if (cfg.nerEnabled) {
            auto ner = std::make_shared<detect::NerDetector>(cfg.defaultLanguage, cfg.nerMinScore);
            for (const auto &kv : cfg.nerEndpoints) {
                ner->setBackend(kv.first, std::make_shared<detect::HttpNerBackend>(
                                              kv.second, static_cast<long>(cfg.nerTimeoutSeconds)));
            }
            if (!ner->supports(cfg.defaultLanguage)) {
                util::logger::warn("[PrivacyGuard] No NER endpoint for default language '" +
                                   cfg.defaultLanguage + "'");
            }
            guard.addDetector(ner);
        }

        util::logger::info("[PrivacyGuard] Initialized with " +
                           std::to_string(guard.detectorCount()) + " detector(s).");
        return guard;
    }

    void addDetector(std::shared_ptr<const detect::Detector> detector)
    {
        if (detector) {
            m_detectors.push_back(std::move(detector));
        }
    }

    size_t detectorCount() const { return m_detectors.size(); }

    /**
     * @throw DetectorFailure if any detector fails.
     * @throw GuardError if text is not valid UTF-8.
     */
    core::AnonymizationResult anonymize(const std::string &text, const std::string &language = "en") const
    {
        util::logger::info("[PrivacyGuard] Anonymizing text (language: " + language + ")...");

        core::Utf8Index utf8(text);

        core::SpanList detected;
        for (const auto &detector : m_detectors) {
            core::SpanList spans = runDetector(*detector, text, language);
            detected.insert(detected.end(),
                            std::make_move_iterator(spans.begin()),
                            std::make_move_iterator(spans.end()));
        }

        core::SpanList accepted = core::SpanReconciler::reconcile(std::move(detected), utf8.codepointCount());
        core::AnonymizationResult result = core::SubstitutionEngine::substitute(text, utf8, accepted);

        util::logger::info("[PrivacyGuard] Anonymization complete, " +
                           std::to_string(result.table.size()) + " placeholder(s).");
        return result;
    }

    /**
     * @brief Anonymize independent texts in parallel. Results keep input order
     *        and each text gets its own table.
     * @throw the first DetectorFailure/GuardError, in input order.
     */
    std::vector<core::AnonymizationResult> anonymizeBatch(const std::vector<std::string> &texts,
                                                          const std::string &language = "en") const
    {
        std::vector<core::AnonymizationResult> results;
        results.reserve(texts.size());
        if (texts.empty()) {
            return results;
        }

        size_t threads = m_workerThreads;
        if (threads == 0) {
            threads = std::max(1u, std::thread::hardware_concurrency());
        }
        util::ThreadPool pool(std::min(texts.size(), threads));
        std::vector<std::future<core::AnonymizationResult>> pending;
        pending.reserve(texts.size());
        for (const auto &text : texts) {
            pending.push_back(pool.enqueue([this, &text, &language] { return anonymize(text, language); }));
        }
        for (auto &fut : pending) {
            results.push_back(fut.get());
        }
        return results;
    }

    std::string restore(const std::string &sanitizedText, const core::RestorationTable &table) const
    {
        util::logger::info("[PrivacyGuard] Restoring text...");
        return core::Restorer::restore(sanitizedText, table);
    }

private:
    static core::SpanList runDetector(const detect::Detector &detector,
                                      const std::string &text,
                                      const std::string &language)
    {
        try {
            return detector.detect(text, language);
        } catch (const DetectorFailure &ex) {
            util::logger::error(std::string("[PrivacyGuard] ") + ex.what());
            throw;
        } catch (const std::exception &ex) {
            util::logger::error("[PrivacyGuard] Detector '" + detector.name() + "' failed: " + ex.what());
            throw DetectorFailure(detector.name(), ex.what());
        }
    }

    std::vector<std::shared_ptr<const detect::Detector>> m_detectors;
    size_t m_workerThreads;
};

} // namespace privacyguard

#endif // PRIVACYGUARD_GUARD_PRIVACY_GUARD_HPP
