#include "vdisk/partition_table.hpp"
#include <stdexcept>
#include <string>

void PartitionTable::add(const Partition& partition) {
    partitions[partition.number] = partition;
}

const Partition& PartitionTable::at(uint32_t number) const {
    auto it = partitions.find(number);
    if (it == partitions.end()) {
        throw std::out_of_range("No such partition: " + std::to_string(number));
    }
    return it->second;
}

const Partition* PartitionTable::find(uint32_t number) const {
    auto it = partitions.find(number);
    return it == partitions.end() ? nullptr : &it->second;
}

std::vector<uint32_t> PartitionTable::numbers() const {
    std::vector<uint32_t> result;
    result.reserve(partitions.size());
    for (const auto& entry : partitions) {
        result.push_back(entry.first);
    }
    return result;
}
