#include "vdisk/console_protocol.hpp"
#include "vdisk/console_parsers.hpp"
#include "vdisk/errors.hpp"
#include <iostream>

ConsoleProtocol::ConsoleProtocol(ConsoleTransport& transport, const ConsoleConfig& config)
    : transport(transport), config(config), desynchronized(false) {}

std::vector<std::string> ConsoleProtocol::collect_response() {
    std::vector<std::string> lines;
    std::string line;
    while (transport.read_line(line)) {
        lines.push_back(line);
    }
    return lines;
}

// ==========================================
// DISCOVERY
// ==========================================
size_t ConsoleProtocol::query_block_size() {
    transport.write_line(config.info_command);

    BlockSizeScanner scanner(config.block_size_label);
    for (const auto& line : collect_response()) {
        scanner.feed(line);
    }

    size_t block_size = scanner.result();
    std::cout << "[Console] MMC block size: " << block_size << "\n";
    return block_size;
}

PartitionTable ConsoleProtocol::query_partitions() {
    transport.write_line(config.partition_command);

    PartitionListScanner scanner;
    for (const auto& line : collect_response()) {
        scanner.feed(line);
    }

    const PartitionTable& table = scanner.result();
    for (uint32_t number : table.numbers()) {
        const Partition& p = table.at(number);
        std::cout << "[Console] Partition " << p.number << ": start=" << p.start
                  << " length=" << p.length << "\n";
    }
    return table;
}

DeviceGeometry ConsoleProtocol::discover() {
    DeviceGeometry geometry;
    geometry.block_size = query_block_size();
    geometry.partitions = query_partitions();
    return geometry;
}

// ==========================================
// BLOCK READ
// ==========================================
std::vector<uint8_t> ConsoleProtocol::read_blocks(uint64_t start, uint64_t length, size_t block_size) {
    if (length == 0) return {};

    // Once a dump went wrong we no longer know what state the shell is in.
    // Issuing more commands could only make it worse.
    if (desynchronized) {
        throw ProtocolError("Console is desynchronized; remount to continue");
    }

    std::cout << "[Console] Reading " << length << " blocks beginning at block " << start << "\n";

    const uint64_t byte_length = length * block_size;
    transport.write_line(config.read_command(start, length));
    transport.write_line(config.dump_command(byte_length));

    try {
        MemoryDumpScanner scanner(config.staging_address, config.dump_line_span);
        for (const auto& line : collect_response()) {
            scanner.feed(line);
        }
        return scanner.finish(static_cast<size_t>(byte_length));
    } catch (const ProtocolError& e) {
        desynchronized = true;
        std::cerr << "[Console] " << e.what() << "\n";
        throw;
    }
}
