/**
 * @file test_command_allowlist.cpp
 * @brief CommandAllowlist unit tests
 */

#include <gtest/gtest.h>
#include "CommandAllowlist.h"
#include "InputSanitizer.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>

using namespace ConsoleGate;

// ============================================================================
// Built-in table
// ============================================================================

TEST(CommandAllowlistTest, DefaultsAreFreeOfMetacharacters) {
    for (const auto& entry : CommandAllowlist::defaults().entries()) {
        EXPECT_FALSE(InputSanitizer::containsDangerousCharacters(entry)) << entry;
    }
}

TEST(CommandAllowlistTest, DefaultsAreNormalized) {
    for (const auto& entry : CommandAllowlist::defaults().entries()) {
        ASSERT_FALSE(entry.empty());
        EXPECT_EQ(entry, InputSanitizer::trim(entry)) << entry;
        EXPECT_EQ(entry.find("  "), std::string::npos) << entry;
        EXPECT_EQ(entry.find('\t'), std::string::npos) << entry;
    }
}

TEST(CommandAllowlistTest, DefaultsCoverEveryFamily) {
    std::set<std::string> families;
    for (const auto& entry : CommandAllowlist::defaults().entries()) {
        families.insert(entry.substr(0, entry.find(' ')));
    }
    for (const char* family : {"auth", "email", "calendar", "contacts", "inbound", "scheduler",
                               "timezone", "webhook", "otp", "admin", "notetaker", "slack", "version"}) {
        EXPECT_TRUE(families.count(family)) << family;
    }
}

TEST(CommandAllowlistTest, DefaultsDepthIsThree) {
    EXPECT_EQ(CommandAllowlist::defaults().maxDepth(), 3u);
}

TEST(CommandAllowlistTest, DefaultsContainKnownEntries) {
    const auto& allowlist = CommandAllowlist::defaults();
    EXPECT_TRUE(allowlist.contains("version"));
    EXPECT_TRUE(allowlist.contains("email list"));
    EXPECT_TRUE(allowlist.contains("calendar events list"));
    EXPECT_TRUE(allowlist.contains("auth status"));

    EXPECT_FALSE(allowlist.contains("email"));
    EXPECT_FALSE(allowlist.contains("rm"));
    EXPECT_FALSE(allowlist.contains("email  list"));
}

TEST(CommandAllowlistTest, EntriesAreSorted) {
    auto entries = CommandAllowlist::defaults().entries();
    EXPECT_TRUE(std::is_sorted(entries.begin(), entries.end()));
    EXPECT_EQ(entries.size(), CommandAllowlist::defaults().size());
}

// ============================================================================
// Construction
// ============================================================================

TEST(CommandAllowlistTest, CustomTableTracksDepth) {
    CommandAllowlist allowlist{"a", "b c", "d e f g"};
    EXPECT_EQ(allowlist.size(), 3u);
    EXPECT_EQ(allowlist.maxDepth(), 4u);
    EXPECT_TRUE(allowlist.contains("d e f g"));
}

TEST(CommandAllowlistTest, EmptyTableHasZeroDepth) {
    CommandAllowlist allowlist(std::vector<std::string>{});
    EXPECT_EQ(allowlist.size(), 0u);
    EXPECT_EQ(allowlist.maxDepth(), 0u);
}

TEST(CommandAllowlistTest, RejectsMalformedEntries) {
    EXPECT_THROW(CommandAllowlist({""}), std::invalid_argument);
    EXPECT_THROW(CommandAllowlist({" email list"}), std::invalid_argument);
    EXPECT_THROW(CommandAllowlist({"email list "}), std::invalid_argument);
    EXPECT_THROW(CommandAllowlist({"email  list"}), std::invalid_argument);
    EXPECT_THROW(CommandAllowlist({"email\tlist"}), std::invalid_argument);
}

TEST(CommandAllowlistTest, RejectsMetacharacterEntries) {
    EXPECT_THROW(CommandAllowlist({"email;list"}), std::invalid_argument);
    EXPECT_THROW(CommandAllowlist({"version", "sh -c $(id)"}), std::invalid_argument);
}
