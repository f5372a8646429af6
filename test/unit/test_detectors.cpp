// test/unit/test_detectors.cpp
// -----------------------------------------------------------
// RegexDetector, NerDetector (against a fake model) and the NER response decoder.

#include <gtest/gtest.h>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>

#include "core/errors.hpp"
#include "core/span_reconciler.hpp"
#include "detect/http_ner_backend.hpp"
#include "detect/ner_detector.hpp"
#include "detect/regex_detector.hpp"
#include "test_helpers.hpp"

namespace {

using privacyguard::DetectorFailure;
using privacyguard::core::Span;
using privacyguard::core::SpanReconciler;
using privacyguard::detect::HttpNerBackend;
using privacyguard::detect::NerDetector;
using privacyguard::detect::OffsetUnit;
using privacyguard::detect::RawEntity;
using privacyguard::detect::RegexDetector;
using privacyguard::test::FakeNerBackend;

TEST(RegexDetectorTest, DefaultPatternsInOrder) {
    RegexDetector regex = RegexDetector::withDefaultPatterns();
    EXPECT_EQ(regex.patternCount(), (size_t)3);
    EXPECT_EQ(regex.name(), "regex");

    auto spans = regex.detect("ann@example.org 555-123-4567", "en");
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[0].label, "EMAIL");
    EXPECT_EQ(spans[1].label, "PHONE");
}

TEST(RegexDetectorTest, Email) {
    auto spans = RegexDetector::withDefaultPatterns().detect("mail ann@example.org today", "en");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0], (Span{5, 20, "EMAIL", "ann@example.org"}));
}

TEST(RegexDetectorTest, OffsetsAreCodepoints) {
    auto spans = RegexDetector::withDefaultPatterns().detect("Zo\xC3\xAB: ann@example.org", "en");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].start, (size_t)5);
    EXPECT_EQ(spans[0].end, (size_t)20);
    EXPECT_EQ(spans[0].content, "ann@example.org");
}

TEST(RegexDetectorTest, PhoneNumbers) {
    RegexDetector regex = RegexDetector::withDefaultPatterns();

    auto a = regex.detect("call 555-123-4567 now", "en");
    ASSERT_EQ(a.size(), (size_t)1);
    EXPECT_EQ(a[0], (Span{5, 17, "PHONE", "555-123-4567"}));

    auto b = regex.detect("call +1-555-0199.", "en");
    ASSERT_EQ(b.size(), (size_t)1);
    EXPECT_EQ(b[0], (Span{5, 16, "PHONE", "+1-555-0199"}));
}

TEST(RegexDetectorTest, PhoneNotAfterWordCharacter) {
    EXPECT_TRUE(RegexDetector::withDefaultPatterns().detect("ref id12345678 end", "en").empty());
}

TEST(RegexDetectorTest, Iban) {
    auto spans = RegexDetector::withDefaultPatterns().detect("IBAN FR7630006000011234567890189 ok", "en");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].label, "IBAN");
    EXPECT_EQ(spans[0].start, (size_t)5);
    EXPECT_EQ(spans[0].end, (size_t)32);
}

TEST(RegexDetectorTest, NonAsciiLettersAreWordCharacters) {
    RegexDetector regex = RegexDetector::withDefaultPatterns();
    // "éann@x.org" and "ann@x.orgé": the address is glued to a letter.
    EXPECT_TRUE(regex.detect("\xC3\xA9" "ann@x.org", "en").empty());
    EXPECT_TRUE(regex.detect("ann@x.org\xC3\xA9", "en").empty());
    EXPECT_TRUE(regex.detect("\xC3\xA9" "FR7630006000011234567890189", "en").empty());

    // NBSP and guillemets are punctuation: "«\u00A0ann@x.org\u00A0»".
    auto quoted = regex.detect("\xC2\xAB\xC2\xA0" "ann@x.org\xC2\xA0\xC2\xBB", "fr");
    ASSERT_EQ(quoted.size(), (size_t)1);
    EXPECT_EQ(quoted[0], (Span{2, 11, "EMAIL", "ann@x.org"}));

    // "call 555-123-4567…" with U+2026 after the number.
    auto phone = regex.detect("call 555-123-4567\xE2\x80\xA6", "en");
    ASSERT_EQ(phone.size(), (size_t)1);
    EXPECT_EQ(phone[0].label, "PHONE");
    EXPECT_EQ(phone[0].end, (size_t)17);
}

TEST(RegexDetectorTest, LongRunsOfWordCharacters) {
    RegexDetector regex = RegexDetector::withDefaultPatterns();
    const std::string blob(100000, 'a');
    EXPECT_TRUE(regex.detect(blob, "en").empty());
    EXPECT_TRUE(regex.detect(blob + "@example.org", "en").empty());

    auto spans = regex.detect(blob + " ann@example.org", "en");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0], (Span{100001, 100016, "EMAIL", "ann@example.org"}));
}

TEST(RegexDetectorTest, OverlongLocalPartIsNotAnEmail) {
    EXPECT_TRUE(RegexDetector::withDefaultPatterns().detect(std::string(65, 'a') + "@example.org", "en").empty());
    EXPECT_EQ(RegexDetector::withDefaultPatterns().detect(std::string(64, 'a') + "@example.org", "en").size(),
              (size_t)1);
}

TEST(RegexDetectorTest, NothingToFind) {
    EXPECT_TRUE(RegexDetector::withDefaultPatterns().detect("", "en").empty());
    EXPECT_TRUE(RegexDetector::withDefaultPatterns().detect("plain words only", "en").empty());
}

TEST(RegexDetectorTest, CustomPattern) {
    RegexDetector regex;
    regex.addPattern("SSN", R"(\b\d{3}-\d{2}-\d{4}\b)");
    auto spans = regex.detect("SSN: 123-45-6789", "fr");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0], (Span{5, 16, "SSN", "123-45-6789"}));

    EXPECT_THROW(regex.addPattern("BAD", "("), std::regex_error);
}

// ---------------------------------------------------------------------------

// "Zoë lives in Paris": 'ë' is two bytes, so byte and codepoint offsets differ by one after it.
const std::string kText = "Zo\xC3\xAB lives in Paris";

std::shared_ptr<FakeNerBackend> fakeModel(OffsetUnit unit, const std::string& tag,
                                          std::vector<RawEntity> entities) {
    return std::make_shared<FakeNerBackend>(std::move(entities), unit, tag);
}

TEST(NerDetectorTest, CodepointOffsets) {
    NerDetector ner("en");
    ner.setBackend("en", fakeModel(OffsetUnit::Codepoint, "en",
                                   {RawEntity{0, 3, "PER", 0.99}, RawEntity{13, 18, "LOC", 0.98}}));
    auto spans = ner.detect(kText, "en");
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[0], (Span{0, 3, "PER", "Zo\xC3\xAB"}));
    EXPECT_EQ(spans[1], (Span{13, 18, "LOC", "Paris"}));
}

TEST(NerDetectorTest, ByteOffsetsAreConverted) {
    NerDetector ner("en");
    ner.setBackend("en", fakeModel(OffsetUnit::Byte, "en",
                                   {RawEntity{0, 4, "PER", 0.99}, RawEntity{14, 19, "LOC", 0.98}}));
    auto spans = ner.detect(kText, "en");
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[0], (Span{0, 3, "PER", "Zo\xC3\xAB"}));
    EXPECT_EQ(spans[1], (Span{13, 18, "LOC", "Paris"}));
}

TEST(NerDetectorTest, ByteOffsetInsideSequenceIsSkipped) {
    NerDetector ner("en");
    ner.setBackend("en", fakeModel(OffsetUnit::Byte, "en", {RawEntity{0, 3, "PER", 0.99}}));
    EXPECT_TRUE(ner.detect(kText, "en").empty());
}

TEST(NerDetectorTest, LowScoresFiltered) {
    NerDetector ner("en", 0.5);
    ner.setBackend("en", fakeModel(OffsetUnit::Codepoint, "en",
                                   {RawEntity{0, 3, "PER", 0.3}, RawEntity{13, 18, "LOC", 0.5}}));
    auto spans = ner.detect(kText, "en");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].label, "LOC");
}

TEST(NerDetectorTest, PicksBackendByLanguage) {
    auto en = fakeModel(OffsetUnit::Codepoint, "en", {RawEntity{0, 3, "PER", 1.0}});
    auto fr = fakeModel(OffsetUnit::Codepoint, "fr", {RawEntity{13, 18, "LOC", 1.0}});
    NerDetector ner("en");
    ner.setBackend("en", en);
    ner.setBackend("fr", fr);
    EXPECT_TRUE(ner.supports("fr"));
    EXPECT_FALSE(ner.supports("de"));

    auto spans = ner.detect(kText, "fr");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].label, "LOC");
    EXPECT_EQ(fr->calls(), (size_t)1);
    EXPECT_EQ(en->calls(), (size_t)0);
}

TEST(NerDetectorTest, UnsupportedLanguageFallsBackToDefault) {
    auto en = fakeModel(OffsetUnit::Codepoint, "en", {RawEntity{0, 3, "PER", 1.0}});
    NerDetector ner("en");
    ner.setBackend("en", en);

    auto spans = ner.detect(kText, "de");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].label, "PER");
    EXPECT_EQ(en->calls(), (size_t)1);
}

TEST(NerDetectorTest, MissingDefaultModelIsFatal) {
    NerDetector ner("en");
    ner.setBackend("fr", fakeModel(OffsetUnit::Codepoint, "fr", {}));
    try {
        ner.detect(kText, "de");
        FAIL() << "expected DetectorFailure";
    } catch (const DetectorFailure& ex) {
        EXPECT_EQ(ex.detectorName(), "ner");
    }
}

TEST(NerDetectorTest, NullBackendIsRejected) {
    NerDetector ner("en");
    EXPECT_THROW(ner.setBackend("de", nullptr), std::invalid_argument);
    EXPECT_FALSE(ner.supports("de"));

    auto en = fakeModel(OffsetUnit::Codepoint, "en", {RawEntity{0, 3, "PER", 1.0}});
    ner.setBackend("en", en);
    auto spans = ner.detect(kText, "de");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(en->calls(), (size_t)1);
}

TEST(NerDetectorTest, ModelErrorsPropagate) {
    auto en = fakeModel(OffsetUnit::Codepoint, "en", {});
    en->setFailing(true);
    NerDetector ner("en");
    ner.setBackend("en", en);
    EXPECT_THROW(ner.detect(kText, "en"), std::runtime_error);
}

TEST(NerDetectorTest, OutOfRangeEntityReachesReconcilerAndIsDropped) {
    NerDetector ner("en");
    ner.setBackend("en", fakeModel(OffsetUnit::Codepoint, "en",
                                   {RawEntity{10, 50, "ORG", 1.0}, RawEntity{0, 3, "PER", 1.0}}));
    auto spans = ner.detect(kText, "en");
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_TRUE(spans[0].content.empty());

    auto accepted = SpanReconciler::reconcile(spans, 18);
    ASSERT_EQ(accepted.size(), (size_t)1);
    EXPECT_EQ(accepted[0].label, "PER");
}

// ---------------------------------------------------------------------------

TEST(HttpNerBackendTest, ParsesAggregatedEntities) {
    auto entities = HttpNerBackend::parseEntities(
        R"([{"entity_group":"PER","score":0.9987,"word":"John Doe","start":8,"end":16},)"
        R"( {"entity_group":"LOC","score":0.75,"word":"new york","start":74,"end":82}])");
    ASSERT_EQ(entities.size(), (size_t)2);
    EXPECT_EQ(entities[0].label, "PER");
    EXPECT_EQ(entities[0].start, (size_t)8);
    EXPECT_EQ(entities[0].end, (size_t)16);
    EXPECT_DOUBLE_EQ(entities[0].score, 0.9987);
    EXPECT_EQ(entities[1].label, "LOC");
}

TEST(HttpNerBackendTest, FallsBackToEntityField) {
    auto entities = HttpNerBackend::parseEntities(R"([{"entity":"B-LOC","start":0,"end":5}])");
    ASSERT_EQ(entities.size(), (size_t)1);
    EXPECT_EQ(entities[0].label, "B-LOC");
    EXPECT_DOUBLE_EQ(entities[0].score, 1.0);
}

TEST(HttpNerBackendTest, EmptyResult) {
    EXPECT_TRUE(HttpNerBackend::parseEntities(" [ ] ").empty());
}

TEST(HttpNerBackendTest, RejectsErrorsAndBadEntities) {
    EXPECT_THROW(HttpNerBackend::parseEntities(R"( {"error":"Model is loading"})"), std::runtime_error);
    EXPECT_THROW(HttpNerBackend::parseEntities(R"([{"entity_group":"PER","end":3}])"), std::runtime_error);
    EXPECT_THROW(HttpNerBackend::parseEntities(R"([{"entity_group":"PER","start":-1,"end":3}])"),
                 std::runtime_error);
    EXPECT_THROW(HttpNerBackend::parseEntities(R"([{"start":0,"end":3}])"), std::runtime_error);
    EXPECT_THROW(HttpNerBackend::parseEntities("not json"), std::runtime_error);
}

} // namespace
