#include "vdisk/console_parsers.hpp"
#include "vdisk/errors.hpp"
#include "util/tokenizer.hpp"
#include <cctype>
#include <limits>
#include <sstream>
#include <utility>

// ==========================================
// BLOCK SIZE
// ==========================================
BlockSizeScanner::BlockSizeScanner(const std::string& label) : label(label), block_size(0) {}

void BlockSizeScanner::feed(const std::string& line) {
    if (line.compare(0, label.size(), label) != 0) return;

    // "Rd Block Len: 512" -> "512"
    std::string digits;
    for (size_t i = label.size(); i < line.size(); i++) {
        if (std::isdigit(static_cast<unsigned char>(line[i]))) digits += line[i];
    }

    uint64_t value = 0;
    if (parse_decimal(digits, value) && value > 0) {
        this->block_size = static_cast<size_t>(value);
    }
}

size_t BlockSizeScanner::result() const {
    if (!found()) {
        throw InitializationError("Could not initialize: no blocksize information found");
    }
    return block_size;
}

// ==========================================
// PARTITION LIST
// ==========================================
PartitionListScanner::PartitionListScanner()
    : row_pattern(R"(^\s*(\d+)\s+(\d+)\s+(\d+)\s+.*$)") {}

void PartitionListScanner::feed(const std::string& line) {
    std::smatch match;
    if (!std::regex_match(line, match, row_pattern)) return;

    uint64_t number = 0, start = 0, length = 0;
    if (!parse_decimal(match[1].str(), number) ||
        !parse_decimal(match[2].str(), start) ||
        !parse_decimal(match[3].str(), length)) {
        return;
    }
    if (number > std::numeric_limits<uint32_t>::max()) return;

    table.add(Partition(static_cast<uint32_t>(number), start, length));
}

const PartitionTable& PartitionListScanner::result() const {
    if (table.empty()) {
        throw InitializationError("Could not initialize: no partition information found");
    }
    return table;
}

// ==========================================
// MEMORY DUMP
// ==========================================
namespace {

std::string dump_pattern(size_t line_span) {
    // "xx " per byte, no trailing space after the last one
    std::stringstream ss;
    ss << R"(^([0-9a-f]{8}):\s*([0-9a-f ]{)" << (line_span * 3 - 1)
       << R"(})\s*.{)" << line_span << R"(}$)";
    return ss.str();
}

uint8_t hex_value(char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    return static_cast<uint8_t>(c - 'a' + 10);
}

} // namespace

MemoryDumpScanner::MemoryDumpScanner(uint64_t start_address, size_t line_span)
    : line_pattern(dump_pattern(line_span)),
      line_span(line_span),
      start_address(start_address),
      next_address(start_address),
      matched_lines(0) {}

void MemoryDumpScanner::feed(const std::string& line) {
    std::smatch match;
    if (!std::regex_match(line, match, line_pattern)) return;

    uint64_t address = 0;
    parse_hex(match[1].str(), address);
    if (address != next_address) {
        throw ProtocolError("Expected address 0x" + to_hex(next_address) +
                            ", got address 0x" + to_hex(address));
    }

    std::string hex;
    for (char c : match[2].str()) {
        if (c != ' ') hex += c;
    }
    if (hex.size() != line_span * 2) {
        throw ProtocolError("Malformed dump line at address 0x" + to_hex(address));
    }

    for (size_t i = 0; i < hex.size(); i += 2) {
        data.push_back(static_cast<uint8_t>((hex_value(hex[i]) << 4) | hex_value(hex[i + 1])));
    }

    next_address += line_span;
    matched_lines++;
}

std::vector<uint8_t> MemoryDumpScanner::finish(size_t expected_bytes) {
    if (matched_lines == 0) {
        throw ProtocolError("Could not read any memory output");
    }
    if (data.size() < expected_bytes) {
        throw ProtocolError("Memory output ended at address 0x" + to_hex(next_address) +
                            ", expected it to reach 0x" + to_hex(start_address + expected_bytes));
    }
    data.resize(expected_bytes);
    return std::move(data);
}
