// test/unit/test_restoration_vault.cpp
// -----------------------------------------------------------
// RestorationVault against a scratch SQLite file.

#include <gtest/gtest.h>
#include <memory>
#include <sqlite3.h>
#include <string>

#include "core/errors.hpp"
#include "core/restoration_table.hpp"
#include "detect/regex_detector.hpp"
#include "guard/privacy_guard.hpp"
#include "storage/restoration_vault.hpp"
#include "test_helpers.hpp"

namespace {

using privacyguard::PrivacyGuard;
using privacyguard::VaultError;
using privacyguard::core::RestorationTable;
using privacyguard::detect::RegexDetector;
using privacyguard::storage::RestorationVault;
using privacyguard::test::ScopedFile;

TEST(RestorationVaultTest, DocumentIdCoversTextAndTable) {
    RestorationTable ann{{"<EMAIL_1>", "ann@example.org"}};
    RestorationTable bob{{"<EMAIL_1>", "bob@example.org"}};

    std::string id = RestorationVault::DocumentId("Mail <EMAIL_1>", ann);
    EXPECT_EQ(id.size(), (size_t)64);
    EXPECT_EQ(id, RestorationVault::DocumentId("Mail <EMAIL_1>", ann));
    EXPECT_NE(id, RestorationVault::DocumentId("Mail <EMAIL_1>", bob));
    EXPECT_NE(id, RestorationVault::DocumentId("Mail <EMAIL_2>", ann));
}

TEST(RestorationVaultTest, StoreAndLoad) {
    ScopedFile db("privacyguard_test_vault.sqlite");
    RestorationVault vault(db.path());
    EXPECT_EQ(vault.Count(), (size_t)0);

    RestorationTable table{{"<PER_1>", "Zo\xC3\xAB"}, {"<EMAIL_1>", "zoe@example.org"}};
    const std::string id = RestorationVault::DocumentId("<PER_1> wrote from <EMAIL_1>", table);
    vault.Store(id, table);
    EXPECT_EQ(vault.Count(), (size_t)1);

    auto loaded = vault.Load(id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, table);
}

TEST(RestorationVaultTest, EmptyTableIsStorable) {
    ScopedFile db("privacyguard_test_vault.sqlite");
    RestorationVault vault(db.path());
    vault.Store("empty", RestorationTable{});
    auto loaded = vault.Load("empty");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->empty());
}

TEST(RestorationVaultTest, SameSanitizedTextKeepsSeparateTables) {
    ScopedFile db("privacyguard_test_vault.sqlite");
    RestorationVault vault(db.path());

    PrivacyGuard guard;
    guard.addDetector(std::make_shared<RegexDetector>(RegexDetector::withDefaultPatterns()));
    auto first = guard.anonymize("Mail ann@example.org", "en");
    auto second = guard.anonymize("Mail bob@example.org", "en");
    ASSERT_EQ(first.sanitizedText, second.sanitizedText);

    const std::string firstId = RestorationVault::DocumentId(first.sanitizedText, first.table);
    const std::string secondId = RestorationVault::DocumentId(second.sanitizedText, second.table);
    EXPECT_NE(firstId, secondId);
    vault.Store(firstId, first.table);
    vault.Store(secondId, second.table);
    EXPECT_EQ(vault.Count(), (size_t)2);

    auto firstTable = vault.Load(firstId);
    auto secondTable = vault.Load(secondId);
    ASSERT_TRUE(firstTable.has_value());
    ASSERT_TRUE(secondTable.has_value());
    EXPECT_EQ(guard.restore(first.sanitizedText, *firstTable), "Mail ann@example.org");
    EXPECT_EQ(guard.restore(second.sanitizedText, *secondTable), "Mail bob@example.org");
}

TEST(RestorationVaultTest, StoreNeverOverwritesADifferentTable) {
    ScopedFile db("privacyguard_test_vault.sqlite");
    RestorationVault vault(db.path());
    RestorationTable original{{"<PER_1>", "Ann"}};
    vault.Store("doc", original);
    EXPECT_NO_THROW(vault.Store("doc", original));
    EXPECT_THROW(vault.Store("doc", RestorationTable{{"<PER_1>", "Bob"}}), VaultError);

    EXPECT_EQ(vault.Count(), (size_t)1);
    auto loaded = vault.Load("doc");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, original);
}

TEST(RestorationVaultTest, MissingAndRemoved) {
    ScopedFile db("privacyguard_test_vault.sqlite");
    RestorationVault vault(db.path());
    EXPECT_FALSE(vault.Load("nope").has_value());

    vault.Store("doc", RestorationTable{{"<PER_1>", "Ann"}});
    EXPECT_TRUE(vault.Remove("doc"));
    EXPECT_FALSE(vault.Remove("doc"));
    EXPECT_FALSE(vault.Load("doc").has_value());
    EXPECT_EQ(vault.Count(), (size_t)0);
}

TEST(RestorationVaultTest, PersistsAcrossConnections) {
    ScopedFile db("privacyguard_test_vault.sqlite");
    {
        RestorationVault vault(db.path());
        vault.Store("doc", RestorationTable{{"<PER_1>", "Ann"}});
    }
    RestorationVault reopened(db.path());
    auto loaded = reopened.Load("doc");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->at("<PER_1>"), "Ann");
}

TEST(RestorationVaultTest, CorruptPayloadThrows) {
    ScopedFile db("privacyguard_test_vault.sqlite");
    RestorationVault vault(db.path());

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(db.path().c_str(), &raw), SQLITE_OK);
    const char* sql = "INSERT INTO restoration_tables (document_id, entry_count, raw_size, payload) "
                      "VALUES ('bad', 1, 20, X'DEADBEEF');";
    EXPECT_EQ(sqlite3_exec(raw, sql, nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(raw);

    EXPECT_THROW(vault.Load("bad"), VaultError);
}

TEST(RestorationVaultTest, UnopenablePathThrows) {
    EXPECT_THROW(RestorationVault("no_such_dir/for/vault.sqlite"), VaultError);
}

} // namespace
