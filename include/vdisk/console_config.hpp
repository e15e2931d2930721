#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

// Everything about the bootloader's command syntax lives here. Targets whose
// U-Boot build differs usually only need a different staging address.
struct ConsoleConfig {
    std::string info_command = "mmc info";
    std::string block_size_label = "Rd Block Len:";
    std::string partition_command = "mmc part";

    // Scratch RAM the blocks are copied to before being dumped.
    uint32_t staging_address = 0x90000000;

    // Bytes per md.b output line.
    size_t dump_line_span = 16;

    // Recognizes "--staging-address=<hex>". Returns false for anything
    // else; throws std::invalid_argument on a malformed value.
    bool apply_option(const std::string& arg);

    // "mmc read <addr> <start> <count>", all hex
    std::string read_command(uint64_t start_block, uint64_t block_count) const;

    // "md.b <addr> <length>", all hex
    std::string dump_command(uint64_t byte_length) const;
};
