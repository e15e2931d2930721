#include "vdisk/console_config.hpp"
#include "util/tokenizer.hpp"
#include <limits>
#include <stdexcept>

bool ConsoleConfig::apply_option(const std::string& arg) {
    const std::string prefix = "--staging-address=";
    if (arg.compare(0, prefix.size(), prefix) != 0) return false;

    uint64_t address = 0;
    if (!parse_hex(arg.substr(prefix.size()), address) ||
        address > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("Invalid staging address: " + arg.substr(prefix.size()));
    }
    staging_address = static_cast<uint32_t>(address);
    return true;
}

std::string ConsoleConfig::read_command(uint64_t start_block, uint64_t block_count) const {
    return "mmc read " + to_hex(staging_address) + " " + to_hex(start_block) + " " + to_hex(block_count);
}

std::string ConsoleConfig::dump_command(uint64_t byte_length) const {
    return "md.b " + to_hex(staging_address) + " " + to_hex(byte_length);
}
