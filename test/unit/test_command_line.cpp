// test/unit/test_command_line.cpp
// -----------------------------------------------------------
// Argument parsing of the privacyguard executable.

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "cli/command_line.hpp"

namespace {

using privacyguard::cli::CliOptions;
using privacyguard::cli::parseArgs;

// Runs parseArgs over a command line given as strings; argv[0] is added.
bool parse(std::vector<std::string> args, CliOptions& opts) {
    args.insert(args.begin(), "privacyguard");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    return parseArgs(static_cast<int>(args.size()), argv.data(), opts);
}

struct ArgCase {
    std::vector<std::string> args;
    bool accepted;
};

TEST(CommandLineTest, AcceptsAndRejects) {
    const std::vector<ArgCase> cases = {
        {{}, false},
        {{"scrub"}, false},
        {{"anonymize"}, true},
        {{"anonymize", "--lang", "fr"}, true},
        {{"anonymize", "--lang"}, false},
        {{"anonymize", "--table", "t.json"}, true},
        {{"anonymize", "--vault"}, true},
        {{"anonymize", "--vault", "--table", "t.json"}, false},
        {{"anonymize", "--verbose"}, false},
        {{"restore"}, false},
        {{"restore", "--table", "t.json"}, true},
        {{"restore", "--vault", "abc123"}, true},
        {{"restore", "--vault"}, false},
        {{"restore", "--vault", "abc123", "--table", "t.json"}, false},
        {{"restore", "--config"}, false},
    };

    for (const auto& c : cases) {
        CliOptions opts;
        std::string line;
        for (const auto& a : c.args) {
            line += a + " ";
        }
        EXPECT_EQ(parse(c.args, opts), c.accepted) << "args: " << line;
    }
}

TEST(CommandLineTest, FillsOptions) {
    CliOptions anonymize;
    ASSERT_TRUE(parse({"anonymize", "--config", "pg.conf", "--lang", "fr", "--vault"}, anonymize));
    EXPECT_EQ(anonymize.command, "anonymize");
    EXPECT_EQ(anonymize.configPath, "pg.conf");
    EXPECT_EQ(anonymize.language, "fr");
    EXPECT_TRUE(anonymize.useVault);
    EXPECT_TRUE(anonymize.vaultId.empty());

    CliOptions restore;
    ASSERT_TRUE(parse({"restore", "--vault", "abc123"}, restore));
    EXPECT_EQ(restore.configPath, "privacyguard.conf");
    EXPECT_EQ(restore.vaultId, "abc123");
    EXPECT_TRUE(restore.language.empty());

    CliOptions table;
    ASSERT_TRUE(parse({"restore", "--table", "t.json"}, table));
    EXPECT_EQ(table.tablePath, "t.json");
    EXPECT_FALSE(table.useVault);
}

TEST(CommandLineTest, ExitCodes) {
    EXPECT_EQ(privacyguard::cli::kExitSuccess, 0);
    EXPECT_EQ(privacyguard::cli::kExitFailure, 1);
    EXPECT_EQ(privacyguard::cli::kExitUsage, 2);
}

} // namespace
