#pragma once

#include <string>
#include <vector>

#include "Result.h"

namespace ConsoleGate {

/**
 * @brief First gate for raw command text
 *
 * Trims surrounding whitespace, then rejects empty input and any input
 * containing a shell metacharacter. The check runs on the whole string
 * before tokenization, so a metacharacter glued to a word is still caught.
 *
 * Commands are never run through a shell; rejecting metacharacters keeps
 * ambiguous input out of the execution path regardless.
 */
class InputSanitizer {
public:
    /**
     * @brief Sanitize raw caller input
     * @return the trimmed command, or an Error whose message is the
     *         rejection reason ("empty command" or
     *         "contains dangerous characters")
     */
    static Result<std::string> sanitize(const std::string& raw);

    static bool containsDangerousCharacters(const std::string& text);

    /**
     * @brief Characters that cause rejection: ; | & ` $ ( ) < > \ newline NUL
     */
    static const std::vector<char>& dangerousCharacters();

    /**
     * @brief Strip ASCII whitespace from both ends
     */
    static std::string trim(const std::string& text);

    static bool isWhitespace(char c);
};

} // namespace ConsoleGate
