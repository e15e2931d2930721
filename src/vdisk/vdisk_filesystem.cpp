#include "vdisk/vdisk_filesystem.hpp"
#include "vdisk/errors.hpp"
#include "util/tokenizer.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <sys/stat.h>

bool FileAttr::is_directory() const {
    return S_ISDIR(mode);
}

VdiskFilesystem::VdiskFilesystem(ConsoleProtocol& protocol, const DeviceGeometry& geometry)
    : geometry(geometry), cache(protocol, geometry.block_size), next_handle(0) {}

const Partition& VdiskFilesystem::resolve_partition(const std::string& path) const {
    uint64_t number = 0;
    if (path.size() < 2 || path[0] != '/' ||
        !parse_decimal(path.substr(1), number) ||
        number > std::numeric_limits<uint32_t>::max()) {
        throw FsError(ENOENT, "No such file: " + path);
    }

    const Partition* partition = geometry.partitions.find(static_cast<uint32_t>(number));
    if (partition == nullptr) {
        throw FsError(ENOENT, "No such partition: " + path);
    }
    return *partition;
}

// ==========================================
// DIRECTORY & ATTRIBUTES (no device I/O)
// ==========================================
std::vector<std::string> VdiskFilesystem::list_dir(const std::string& path) const {
    if (path != "/") {
        throw FsError(ENOENT, "No such directory: " + path);
    }

    std::vector<std::string> entries;
    for (uint32_t number : geometry.partitions.numbers()) {
        entries.push_back(std::to_string(number));
    }
    return entries;
}

FileAttr VdiskFilesystem::get_attr(const std::string& path) const {
    FileAttr attr;
    if (path == "/") {
        attr.mode = S_IFDIR | 0555;
        attr.nlink = 2;
        return attr;
    }

    const Partition& partition = resolve_partition(path);
    attr.mode = S_IFREG | 0444;
    attr.nlink = 1;
    attr.size = partition.byte_size(geometry.block_size);
    return attr;
}

uint64_t VdiskFilesystem::open(const std::string& path, int flags) {
    if ((flags & O_ACCMODE) != O_RDONLY) {
        throw FsError(EACCES, "Read-only filesystem: " + path);
    }

    get_attr(path);
    return ++next_handle;
}

// ==========================================
// READ: byte range -> whole blocks -> byte range
// ==========================================
std::vector<uint8_t> VdiskFilesystem::read(const std::string& path, size_t size, uint64_t offset) {
    const Partition& partition = resolve_partition(path);
    const uint64_t block_size = geometry.block_size;
    const uint64_t partition_bytes = partition.byte_size(geometry.block_size);

    if (offset >= partition_bytes || size == 0) return {};

    // 1. First block and where our bytes begin inside it
    uint64_t start_block = offset / block_size + partition.start;
    uint64_t block_offset = offset % block_size;

    // 2. Clamp the end to the partition, round it up to a whole block
    uint64_t end_byte = partition_bytes;
    if (size < partition_bytes - offset) end_byte = offset + size;
    uint64_t end_block = end_byte / block_size + partition.start;
    if (end_byte % block_size > 0) end_block++;

    uint64_t block_count = end_block - start_block;
    uint64_t byte_count = end_byte - offset;

    // 3. Fetch whole blocks, then trim to the exact range
    std::vector<uint8_t> data = cache.get(start_block, block_count);
    auto first = data.begin() + block_offset;
    return std::vector<uint8_t>(first, first + byte_count);
}

size_t VdiskFilesystem::read_into(const std::string& path, char* buffer, size_t size, uint64_t offset) {
    std::vector<uint8_t> data = read(path, size, offset);
    if (!data.empty()) {
        std::memcpy(buffer, data.data(), data.size());
    }
    return data.size();
}
