#include "InputSanitizer.h"
#include "ErrorCodes.h"

#include <algorithm>

namespace ConsoleGate {

namespace {
    const char* const COMPONENT = "Sanitizer";
}

const std::vector<char>& InputSanitizer::dangerousCharacters() {
    static const std::vector<char> chars = {
        ';', '|', '&', '`', '$', '(', ')', '<', '>', '\\', '\n', '\0'
    };
    return chars;
}

bool InputSanitizer::isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

std::string InputSanitizer::trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(), isWhitespace);
    if (first == text.end()) {
        return "";
    }
    auto last = std::find_if_not(text.rbegin(), text.rend(), isWhitespace).base();
    return std::string(first, last);
}

bool InputSanitizer::containsDangerousCharacters(const std::string& text) {
    const auto& chars = dangerousCharacters();
    return std::any_of(text.begin(), text.end(), [&chars](char c) {
        return std::find(chars.begin(), chars.end(), c) != chars.end();
    });
}

Result<std::string> InputSanitizer::sanitize(const std::string& raw) {
    std::string clean = trim(raw);

    if (clean.empty()) {
        return Core::ErrorRegistry::createError(Core::ErrorCode::EMPTY_COMMAND, COMPONENT);
    }

    if (containsDangerousCharacters(clean)) {
        return Core::ErrorRegistry::createError(Core::ErrorCode::DANGEROUS_CHARACTERS, COMPONENT);
    }

    return clean;
}

} // namespace ConsoleGate
