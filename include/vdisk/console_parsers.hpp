#pragma once
#include "vdisk/partition_table.hpp"
#include <cstddef>
#include <cstdint>
#include <regex>
#include <string>
#include <vector>

// Each scanner consumes the lines of one console response in order.
// The response is over when the transport times out; the caller then asks
// the scanner for its result, which is where completeness is validated.

// Waits for the labeled "Rd Block Len: 512" line of `mmc info`.
class BlockSizeScanner {
private:
    std::string label;
    size_t block_size;

public:
    explicit BlockSizeScanner(const std::string& label);

    void feed(const std::string& line);

    bool found() const { return block_size != 0; }
    // Throws InitializationError if no labeled line was seen.
    size_t result() const;
};

// Collects "<number> <start> <length> <anything>" rows of `mmc part`.
class PartitionListScanner {
private:
    std::regex row_pattern;
    PartitionTable table;

public:
    PartitionListScanner();

    void feed(const std::string& line);

    // Throws InitializationError if no row matched.
    const PartitionTable& result() const;
};

// Decodes `md.b` output: "90000000: 00 11 .. ff    ................".
// Lines must arrive at consecutive addresses starting at the staging
// address; anything else means the console is out of step with us.
class MemoryDumpScanner {
private:
    std::regex line_pattern;
    size_t line_span;
    uint64_t start_address;
    uint64_t next_address;
    size_t matched_lines;
    std::vector<uint8_t> data;

public:
    MemoryDumpScanner(uint64_t start_address, size_t line_span);

    // Throws ProtocolError on an address jump.
    void feed(const std::string& line);

    size_t lines() const { return matched_lines; }

    // Throws ProtocolError if nothing matched or fewer than
    // `expected_bytes` arrived.
    std::vector<uint8_t> finish(size_t expected_bytes);
};
