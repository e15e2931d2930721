#pragma once
#include "vdisk/console_config.hpp"
#include "vdisk/console_transport.hpp"
#include "vdisk/partition_table.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Drives the U-Boot shell: fixed commands out, structured data scraped back.
class ConsoleProtocol {
private:
    ConsoleTransport& transport;
    ConsoleConfig config;
    bool desynchronized;

    // Every line until the transport times out.
    std::vector<std::string> collect_response();

    size_t query_block_size();
    PartitionTable query_partitions();

public:
    ConsoleProtocol(ConsoleTransport& transport, const ConsoleConfig& config = ConsoleConfig());

    // Runs `mmc info` then `mmc part`. Throws InitializationError.
    DeviceGeometry discover();

    // Raw bytes of `length` blocks starting at absolute block `start`.
    // Throws ProtocolError; after the first one the session is considered
    // lost and later calls fail without issuing commands.
    std::vector<uint8_t> read_blocks(uint64_t start, uint64_t length, size_t block_size);

    bool is_desynchronized() const { return desynchronized; }
};
