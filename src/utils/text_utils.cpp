#include "utils/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace affectrt {
namespace utils {
namespace text {

std::string toLower(const std::string& input) {
    std::string lower = input;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string trim(const std::string& input) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(input.begin(), input.end(), notSpace);
    auto end = std::find_if(input.rbegin(), input.rend(), notSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

namespace {

// Byte length of a typographic apostrophe starting at i (U+2018, U+2019, U+02BC), else 0
size_t apostropheVariantAt(const std::string& input, size_t i) {
    const auto byte = [&input](size_t k) { return static_cast<unsigned char>(input[k]); };
    if (i + 2 < input.size() && byte(i) == 0xE2 && byte(i + 1) == 0x80 &&
        (byte(i + 2) == 0x98 || byte(i + 2) == 0x99)) {
        return 3;
    }
    if (i + 1 < input.size() && byte(i) == 0xCA && byte(i + 1) == 0xBC) {
        return 2;
    }
    return 0;
}

std::string withoutApostrophes(std::string text) {
    text.erase(std::remove(text.begin(), text.end(), '\''), text.end());
    return text;
}

} // namespace

std::string normalize(const std::string& input) {
    std::string out = " ";
    out.reserve(input.size() + 2);
    for (size_t i = 0; i < input.size(); ++i) {
        if (const size_t width = apostropheVariantAt(input, i)) {
            out += '\'';
            i += width - 1;
            continue;
        }
        const auto c = static_cast<unsigned char>(input[i]);
        if (std::isalnum(c) || c == '\'') {
            out += static_cast<char>(std::tolower(c));
        } else if (out.back() != ' ') {
            out += ' ';
        }
    }
    if (out.back() != ' ') {
        out += ' ';
    }

    // Keep apostrophes only inside words; quote marks become word breaks
    std::string words;
    words.reserve(out.size());
    for (size_t k = 0; k < out.size(); ++k) {
        const bool quote = out[k] == '\'' &&
            !(std::isalnum(static_cast<unsigned char>(out[k - 1])) &&
              std::isalnum(static_cast<unsigned char>(out[k + 1])));
        const char c = quote ? ' ' : out[k];
        if (c != ' ' || words.empty() || words.back() != ' ') {
            words += c;
        }
    }
    return words;
}

bool containsPhrase(const std::string& normalized, const std::string& phrase) {
    if (phrase.empty()) {
        return false;
    }
    // "don't want to live" also matches when typed as "dont want to live"
    const std::string pattern = normalize(phrase);
    if (normalized.find(pattern) != std::string::npos) {
        return true;
    }
    return pattern.find('\'') != std::string::npos &&
           normalized.find(withoutApostrophes(pattern)) != std::string::npos;
}

size_t countPhrases(const std::string& normalized, const std::vector<std::string>& phrases) {
    return static_cast<size_t>(std::count_if(phrases.begin(), phrases.end(),
        [&normalized](const std::string& phrase) { return containsPhrase(normalized, phrase); }));
}

size_t countWords(const std::string& input) {
    std::istringstream iss(input);
    size_t count = 0;
    std::string word;
    while (iss >> word) {
        count++;
    }
    return count;
}

bool endsWithTerminalPunctuation(const std::string& input) {
    std::string trimmed = trim(input);
    if (trimmed.empty()) {
        return false;
    }
    char last = trimmed.back();
    return last == '.' || last == '!' || last == '?';
}

std::string excerpt(const std::string& input, size_t maxChars) {
    std::string trimmed = trim(input);
    if (trimmed.size() <= maxChars) {
        return trimmed;
    }
    // back off to a UTF-8 code point boundary
    size_t cut = maxChars;
    while (cut > 0 && (static_cast<unsigned char>(trimmed[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return trim(trimmed.substr(0, cut));
}

} // namespace text
} // namespace utils
} // namespace affectrt
