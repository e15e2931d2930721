#include "vdisk/block_cache.hpp"
#include "vdisk/errors.hpp"
#include <stdexcept>
#include <string>

BlockCache::BlockCache(ConsoleProtocol& protocol, size_t block_size)
    : protocol(protocol), block_size(block_size) {
    if (block_size == 0) {
        throw std::invalid_argument("Block size must be positive");
    }
}

bool BlockCache::contains(uint64_t block) const {
    return blocks.count(block) != 0;
}

void BlockCache::fetch_run(uint64_t start, uint64_t length, std::vector<uint8_t>& out) {
    std::vector<uint8_t> data = protocol.read_blocks(start, length, block_size);
    if (data.size() != length * block_size) {
        throw ProtocolError("Console returned " + std::to_string(data.size()) + " bytes for " +
                            std::to_string(length) + " blocks");
    }

    stats.fetches++;
    stats.misses += length;

    // Only whole blocks go into the cache
    for (uint64_t i = 0; i < length; i++) {
        auto first = data.begin() + i * block_size;
        blocks[start + i] = std::vector<uint8_t>(first, first + block_size);
    }

    out.insert(out.end(), data.begin(), data.end());
}

std::vector<uint8_t> BlockCache::get(uint64_t start, uint64_t length) {
    std::vector<uint8_t> result;
    if (length == 0) return result;

    result.reserve(length * block_size);

    // Missing blocks are not fetched one by one: we remember where the
    // current run of misses began and fetch it in one go when it ends.
    bool in_run = false;
    uint64_t run_start = 0;

    for (uint64_t block = start; block < start + length; block++) {
        if (!contains(block)) {
            if (!in_run) {
                in_run = true;
                run_start = block;
            }
            continue;
        }

        // The run must land before this hit to keep the bytes in order.
        if (in_run) {
            fetch_run(run_start, block - run_start, result);
            in_run = false;
        }

        // Looked up after the flush; inserting may rehash the map.
        const std::vector<uint8_t>& cached = blocks.at(block);
        stats.hits++;
        result.insert(result.end(), cached.begin(), cached.end());
    }

    if (in_run) {
        fetch_run(run_start, start + length - run_start, result);
    }

    return result;
}
