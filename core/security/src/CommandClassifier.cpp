#include "CommandClassifier.h"
#include "InputSanitizer.h"

#include <algorithm>

namespace ConsoleGate {

CommandClassifier::CommandClassifier(const CommandAllowlist& allowlist)
    : allowlist_(allowlist) {
}

std::vector<std::string> CommandClassifier::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (char c : text) {
        if (InputSanitizer::isWhitespace(c)) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }

    return tokens;
}

std::string CommandClassifier::joinTokens(const std::vector<std::string>& tokens, size_t count) {
    std::string joined;
    count = std::min(count, tokens.size());
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            joined += ' ';
        }
        joined += tokens[i];
    }
    return joined;
}

ClassificationResult CommandClassifier::classify(const std::string& cleanCommand) const {
    ClassificationResult result;
    result.tokens = tokenize(cleanCommand);

    if (result.tokens.empty()) {
        return result;
    }

    size_t depth = std::min(result.tokens.size(), allowlist_.maxDepth());
    for (size_t n = depth; n >= 1; --n) {
        std::string prefix = joinTokens(result.tokens, n);
        if (allowlist_.contains(prefix)) {
            result.baseCommand = std::move(prefix);
            result.authorized = true;
            break;
        }
    }

    return result;
}

} // namespace ConsoleGate
