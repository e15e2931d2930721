#pragma once
#include "vdisk/console_protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

struct CacheStats {
    uint64_t hits = 0;    // blocks served from memory
    uint64_t misses = 0;  // blocks fetched from the console
    uint64_t fetches = 0; // console round-trips
};

// Remembers every block ever fetched for the life of the mount. The device
// is assumed not to change underneath us, so nothing is invalidated or
// evicted. Not thread-safe: callers are serialized by the single-threaded
// filesystem loop.
class BlockCache {
private:
    ConsoleProtocol& protocol;
    size_t block_size;
    std::unordered_map<uint64_t, std::vector<uint8_t>> blocks;
    CacheStats stats;

    // Fetches one contiguous run, stores each block, appends to `out`.
    void fetch_run(uint64_t start, uint64_t length, std::vector<uint8_t>& out);

public:
    BlockCache(ConsoleProtocol& protocol, size_t block_size);

    // `length` blocks starting at `start`, in block order. Runs of missing
    // blocks are fetched with one console round-trip each.
    std::vector<uint8_t> get(uint64_t start, uint64_t length);

    bool contains(uint64_t block) const;
    size_t cached_blocks() const { return blocks.size(); }
    const CacheStats& get_stats() const { return stats; }
};
