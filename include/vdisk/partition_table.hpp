#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

struct Partition {
    uint32_t number;
    uint64_t start;  // absolute block index
    uint64_t length; // in blocks

    Partition() : number(0), start(0), length(0) {}
    Partition(uint32_t n, uint64_t s, uint64_t l) : number(n), start(s), length(l) {}

    uint64_t byte_size(size_t block_size) const { return length * block_size; }
};

// Partition number -> Partition, filled once at discovery.
class PartitionTable {
private:
    std::map<uint32_t, Partition> partitions;

public:
    // A repeated number replaces the earlier entry.
    void add(const Partition& partition);

    const Partition& at(uint32_t number) const;
    const Partition* find(uint32_t number) const;

    // Ascending partition numbers
    std::vector<uint32_t> numbers() const;

    size_t size() const { return partitions.size(); }
    bool empty() const { return partitions.empty(); }
};

// What discovery learns about the device.
struct DeviceGeometry {
    size_t block_size = 0;
    PartitionTable partitions;
};
