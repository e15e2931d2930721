#include "util/tokenizer.hpp"
#include <cctype>
#include <limits>
#include <sstream>

std::vector<std::string> split_words(const std::string& input) {
    std::vector<std::string> tokens;
    std::stringstream ss(input);
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool parse_decimal(const std::string& text, uint64_t& value) {
    if (text.empty()) return false;

    const uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t result = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (result > (max - digit) / 10) return false;
        result = result * 10 + digit;
    }
    value = result;
    return true;
}

bool parse_hex(const std::string& text, uint64_t& value) {
    size_t pos = 0;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        pos = 2;
    }
    if (pos >= text.size()) return false;

    uint64_t result = 0;
    for (; pos < text.size(); pos++) {
        char c = text[pos];
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        if (result >> 60) return false;

        uint64_t digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else digit = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        result = (result << 4) | digit;
    }
    value = result;
    return true;
}

std::string to_hex(uint64_t value) {
    std::stringstream ss;
    ss << std::hex << value;
    return ss.str();
}
