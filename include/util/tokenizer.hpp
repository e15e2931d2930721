#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Splits on runs of whitespace.
std::vector<std::string> split_words(const std::string& input);

// Digits only, no sign or whitespace. Returns false on overflow.
bool parse_decimal(const std::string& text, uint64_t& value);

// Hex digits with an optional 0x prefix. Returns false on overflow.
bool parse_hex(const std::string& text, uint64_t& value);

std::string to_hex(uint64_t value);
