#pragma once

#include <string>
#include <vector>

namespace affectrt {
namespace utils {
namespace text {

std::string toLower(const std::string& input);
std::string trim(const std::string& input);

/**
 * Lowercase the input and replace every character that is not a letter,
 * digit or apostrophe with a single space. Typographic apostrophes are
 * folded to ' and kept only inside words. The result is padded with one
 * space on each side so phrase lookups can anchor on word boundaries.
 */
std::string normalize(const std::string& input);

/**
 * Whole-word / whole-phrase test against a string produced by normalize().
 * "what" does not match inside "whatever". A phrase with apostrophes also
 * matches its spelling without them.
 */
bool containsPhrase(const std::string& normalized, const std::string& phrase);

/**
 * Number of distinct phrases from the list that occur in the normalized text.
 */
size_t countPhrases(const std::string& normalized, const std::vector<std::string>& phrases);

size_t countWords(const std::string& input);
bool endsWithTerminalPunctuation(const std::string& input);

/**
 * At most maxChars bytes of the input, trimmed, never splitting a UTF-8
 * code point.
 */
std::string excerpt(const std::string& input, size_t maxChars);

} // namespace text
} // namespace utils
} // namespace affectrt
