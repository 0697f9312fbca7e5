#pragma once

#include <string>
#include <vector>

#include "CommandAllowlist.h"

namespace ConsoleGate {

struct ClassificationResult {
    std::vector<std::string> tokens;   // full argv, flags included
    std::string baseCommand;           // matched allowlist entry, "" if none
    bool authorized{false};
};

/**
 * @brief Greedy longest-prefix match of a sanitized command against an allowlist
 *
 * Probes the space-joined first N tokens for N = min(token count,
 * allowlist depth) down to 1; the first hit wins. Only the command name is
 * checked. Trailing arguments are passed through untouched and never make
 * classification fail.
 */
class CommandClassifier {
public:
    explicit CommandClassifier(const CommandAllowlist& allowlist);

    ClassificationResult classify(const std::string& cleanCommand) const;

    /**
     * @brief Split on runs of ASCII whitespace
     */
    static std::vector<std::string> tokenize(const std::string& text);

    static std::string joinTokens(const std::vector<std::string>& tokens, size_t count);

private:
    const CommandAllowlist& allowlist_;
};

} // namespace ConsoleGate
