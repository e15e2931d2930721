#pragma once
#include "vdisk/block_cache.hpp"
#include "vdisk/console_protocol.hpp"
#include "vdisk/partition_table.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <vector>

struct FileAttr {
    mode_t mode = 0;
    nlink_t nlink = 0;
    uint64_t size = 0;

    bool is_directory() const;
};

// Presents each partition as a flat read-only file "/<number>".
// No per-handle state is kept: every read is resolved from its path and
// offset alone.
class VdiskFilesystem {
private:
    DeviceGeometry geometry;
    BlockCache cache;
    uint64_t next_handle;

    // Throws FsError(ENOENT) unless `path` names a partition.
    const Partition& resolve_partition(const std::string& path) const;

public:
    VdiskFilesystem(ConsoleProtocol& protocol, const DeviceGeometry& geometry);

    // Partition numbers as decimal strings. Only "/" can be listed.
    std::vector<std::string> list_dir(const std::string& path) const;

    FileAttr get_attr(const std::string& path) const;

    // `flags` are open(2) flags. Write access is refused with EACCES.
    uint64_t open(const std::string& path, int flags);

    // Up to `size` bytes at `offset`; empty at or past end of partition.
    std::vector<uint8_t> read(const std::string& path, size_t size, uint64_t offset);

    // Same as read() but copies into a caller buffer of at least `size`
    // bytes. Returns the number of bytes copied.
    size_t read_into(const std::string& path, char* buffer, size_t size, uint64_t offset);

    const PartitionTable& get_partitions() const { return geometry.partitions; }
    const BlockCache& get_cache() const { return cache; }
};
