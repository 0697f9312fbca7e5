/**
 * @file test_command_runner.cpp
 * @brief End-to-end runner tests: sanitize, classify, execute, compose
 *
 * /bin/echo stands in for the trusted CLI so the argv handed to the
 * subprocess comes back verbatim as output.
 */

#include <gtest/gtest.h>
#include "CommandRunner.h"

#include <chrono>
#include <string>
#include <vector>

using namespace ConsoleGate;
using namespace std::chrono_literals;

class SandboxedRunnerTest : public ::testing::Test {
protected:
    SandboxedRunnerTest()
        : runner_(CommandAllowlist::defaults(), echoOptions()) {}

    static RunnerOptions echoOptions() {
        RunnerOptions options;
        options.trustedBinary = "/bin/echo";
        options.pathFallback = false;
        options.timeout = 5s;
        return options;
    }

    CommandResponse run(const std::string& command) {
        return runner_.run(command, SubprocessExecutor::CancelCheck());
    }

    SandboxedCommandRunner runner_;
};

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(SandboxedRunnerTest, AuthorizedCommandPassesArgvThrough) {
    auto auth = runner_.authorize("email list --limit 10");
    ASSERT_TRUE(auth.isOk());
    EXPECT_EQ(auth.value().baseCommand, "email list");
    EXPECT_EQ(auth.value().tokens, (std::vector<std::string>{"email", "list", "--limit", "10"}));

    auto response = run("email list --limit 10");
    EXPECT_EQ(response.httpStatus, 200);
    ASSERT_TRUE(response.output.has_value());
    EXPECT_EQ(*response.output, "email list --limit 10\n");
}

TEST_F(SandboxedRunnerTest, EmptyCommandIsRejected) {
    auto response = run("");
    EXPECT_EQ(response.httpStatus, 403);
    EXPECT_EQ(response.toJson(), "{\"error\":\"Command not allowed: empty command\"}");
}

TEST_F(SandboxedRunnerTest, MetacharacterRejectedEvenWithAllowedPrefix) {
    auto response = run("email list; rm -rf /");
    EXPECT_EQ(response.httpStatus, 403);
    EXPECT_EQ(*response.error, "Command not allowed: contains dangerous characters");
}

TEST_F(SandboxedRunnerTest, UnlistedCommandIsRejectedWithItsText) {
    auto response = run("sudo anything");
    EXPECT_EQ(response.httpStatus, 403);
    EXPECT_EQ(*response.error, "Command not allowed: sudo anything");
}

TEST_F(SandboxedRunnerTest, ThreeTokenPrefix) {
    auto auth = runner_.authorize("calendar events list --days 7");
    ASSERT_TRUE(auth.isOk());
    EXPECT_EQ(auth.value().baseCommand, "calendar events list");

    auto response = run("calendar events list --days 7");
    EXPECT_EQ(*response.output, "calendar events list --days 7\n");
}

TEST_F(SandboxedRunnerTest, SingleTokenPrefix) {
    auto auth = runner_.authorize("version");
    ASSERT_TRUE(auth.isOk());
    EXPECT_EQ(auth.value().baseCommand, "version");
    EXPECT_EQ(*run("version").output, "version\n");
}

// ============================================================================
// Edge cases
// ============================================================================

TEST_F(SandboxedRunnerTest, RejectionReasonUsesTrimmedCommand) {
    auto response = run("   sudo   anything  ");
    EXPECT_EQ(*response.error, "Command not allowed: sudo   anything");
}

TEST_F(SandboxedRunnerTest, WhitespaceOnlyIsEmpty) {
    EXPECT_EQ(*run(" \t\n ").error, "Command not allowed: empty command");
}

TEST(SandboxedRunnerFailureTest, MissingTrustedBinaryIsCommandFailure) {
    RunnerOptions options;
    options.trustedBinary = "/nonexistent/consolegate";
    options.pathFallback = false;
    SandboxedCommandRunner runner(CommandAllowlist::defaults(), options);

    auto response = runner.run("version", SubprocessExecutor::CancelCheck());
    EXPECT_EQ(response.httpStatus, 200);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->rfind("Command failed: ", 0), 0u);
}

TEST(SandboxedRunnerFailureTest, SilentNonZeroExitReportsStatus) {
    RunnerOptions options;
    options.trustedBinary = "/bin/false";
    SandboxedCommandRunner runner(CommandAllowlist::defaults(), options);

    auto response = runner.run("version", SubprocessExecutor::CancelCheck());
    EXPECT_EQ(response.httpStatus, 200);
    EXPECT_EQ(*response.error, "Command failed: exit status 1");
}

TEST(SandboxedRunnerFailureTest, TimeoutIsReported) {
    RunnerOptions options;
    options.trustedBinary = "/bin/sleep";
    options.timeout = 200ms;
    CommandAllowlist allowlist{"5"};
    SandboxedCommandRunner runner(allowlist, options);

    auto start = std::chrono::steady_clock::now();
    auto response = runner.run("5", SubprocessExecutor::CancelCheck());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
    EXPECT_EQ(*response.error, "Command failed: command timed out after 200ms");
}

TEST(SandboxedRunnerFailureTest, CustomAllowlistIsHonored) {
    RunnerOptions options;
    options.trustedBinary = "/bin/echo";
    CommandAllowlist allowlist{"deploy status"};
    SandboxedCommandRunner runner(allowlist, options);

    EXPECT_TRUE(runner.authorize("deploy status --all").isOk());
    EXPECT_TRUE(runner.authorize("email list").isError());
}

// ============================================================================
// Demo runner
// ============================================================================

TEST(DemoRunnerTest, KnownCommandsHaveSampleOutput) {
    DemoCommandRunner runner;
    auto response = runner.run("email list --limit 5", SubprocessExecutor::CancelCheck());
    EXPECT_EQ(response.httpStatus, 200);
    ASSERT_TRUE(response.output.has_value());
    EXPECT_EQ(response.output->rfind("Demo Mode - Sample Emails", 0), 0u);
}

TEST(DemoRunnerTest, VersionIsCanned) {
    EXPECT_NE(DemoCommandRunner::cannedOutput("version").find("demo mode"), std::string::npos);
}

TEST(DemoRunnerTest, EmptyCommand) {
    EXPECT_EQ(DemoCommandRunner::cannedOutput("   "), "Demo mode - no command specified");
}

TEST(DemoRunnerTest, UnknownCommandEchoesInput) {
    auto text = DemoCommandRunner::cannedOutput("  sudo anything ");
    EXPECT_EQ(text.rfind("Demo Mode - Command: sudo anything", 0), 0u);
}

TEST(DemoRunnerTest, NeverExecutesAnything) {
    DemoCommandRunner runner;
    auto response = runner.run("email list; rm -rf /", SubprocessExecutor::CancelCheck());
    EXPECT_EQ(response.httpStatus, 200);
    EXPECT_FALSE(response.error.has_value());
    EXPECT_STREQ(runner.name(), "demo");
}
