#include "fake_uboot_console.hpp"
#include "vdisk/console_protocol.hpp"
#include "vdisk/errors.hpp"
#include "vdisk/vdisk_filesystem.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <vector>

#define ASSERT(condition, message) \
    if (!(condition)) { \
        std::cerr << "[FAIL] " << message << " (" << #condition << ")\n"; \
        std::exit(1); \
    } else { \
        std::cout << "[PASS] " << message << "\n"; \
    }

#define ASSERT_THROWS(code, message) \
    { \
        bool caught = false; \
        try { code; } \
        catch (const std::exception&) { caught = true; } \
        if (!caught) { \
            std::cerr << "[FAIL] " << message << " (Expected exception but none thrown)\n"; \
            std::exit(1); \
        } else { \
            std::cout << "[PASS] " << message << "\n"; \
        } \
    }

#define ASSERT_ERRNO(code, expected, message) \
    { \
        int got = 0; \
        try { code; } \
        catch (const FsError& e) { got = e.error_code(); } \
        if (got != (expected)) { \
            std::cerr << "[FAIL] " << message << " (errno " << got << ", expected " << (expected) << ")\n"; \
            std::exit(1); \
        } else { \
            std::cout << "[PASS] " << message << "\n"; \
        } \
    }

const size_t BS = 512;

// Device with partitions 1 and 8; mounts by discovering through the console.
struct MountedDevice {
    FakeUbootConsole console;
    ConsoleProtocol protocol;
    VdiskFilesystem fs;

    MountedDevice()
        : console(BS, {Partition(1, 8, 16), Partition(8, 100, 4)}, 128),
          protocol(console),
          fs(protocol, protocol.discover()) {
        console.commands.clear();
    }
};

// ==========================================
// DIRECTORY & ATTRIBUTES
// ==========================================
void test_list_dir() {
    std::cout << "\n=== Filesystem Tests: Listing ===\n";
    MountedDevice dev;

    std::vector<std::string> entries = dev.fs.list_dir("/");
    ASSERT(entries.size() == 2 && entries[0] == "1" && entries[1] == "8", "Root lists partition numbers");
    ASSERT_ERRNO(dev.fs.list_dir("/8"), ENOENT, "Partition is not a directory");
    ASSERT_ERRNO(dev.fs.list_dir("/sub"), ENOENT, "No subdirectories");
    ASSERT(dev.console.commands.empty(), "Listing does no device I/O");
}

void test_get_attr() {
    std::cout << "\n=== Filesystem Tests: Attributes ===\n";
    MountedDevice dev;

    FileAttr root = dev.fs.get_attr("/");
    ASSERT(root.is_directory() && (root.mode & 0777) == 0555 && root.nlink == 2, "Root is a read-only directory");

    FileAttr p8 = dev.fs.get_attr("/8");
    ASSERT(S_ISREG(p8.mode) && (p8.mode & 0777) == 0444 && p8.nlink == 1, "Partition is a read-only file");
    ASSERT(p8.size == 4 * BS, "Partition size is length * block size");
    ASSERT(dev.fs.get_attr("/8").size == p8.size, "Size is stable across calls");
    ASSERT(dev.fs.get_attr("/1").size == 16 * BS, "Other partition sized too");

    ASSERT_ERRNO(dev.fs.get_attr("/2"), ENOENT, "Unknown partition not found");
    ASSERT_ERRNO(dev.fs.get_attr("/abc"), ENOENT, "Non-numeric name not found");
    ASSERT_ERRNO(dev.fs.get_attr("/-8"), ENOENT, "Signed name not found");
    ASSERT_ERRNO(dev.fs.get_attr("/8/x"), ENOENT, "Nested path not found");
    ASSERT_ERRNO(dev.fs.get_attr("//8"), ENOENT, "Doubled slash not found");
    ASSERT_ERRNO(dev.fs.get_attr("8"), ENOENT, "Relative name not found");
    ASSERT_ERRNO(dev.fs.get_attr("/99999999999999999999"), ENOENT, "Overflowing number not found");
    ASSERT(dev.console.commands.empty(), "Attributes do no device I/O");
}

void test_open() {
    std::cout << "\n=== Filesystem Tests: Open ===\n";
    MountedDevice dev;

    uint64_t first = dev.fs.open("/8", O_RDONLY);
    uint64_t second = dev.fs.open("/8", O_RDONLY);
    ASSERT(second > first, "Handles increase");

    ASSERT_ERRNO(dev.fs.open("/8", O_WRONLY), EACCES, "Write-only open refused");
    ASSERT_ERRNO(dev.fs.open("/8", O_RDWR), EACCES, "Read-write open refused");
    ASSERT_ERRNO(dev.fs.open("/8", O_RDWR | O_APPEND), EACCES, "Append open refused");
    ASSERT_ERRNO(dev.fs.open("/3", O_RDONLY), ENOENT, "Open of unknown partition not found");
}

// ==========================================
// READS
// ==========================================
void test_read_first_bytes() {
    std::cout << "\n=== Filesystem Tests: Read Start of Partition ===\n";
    MountedDevice dev;

    std::vector<uint8_t> data = dev.fs.read("/8", 10, 0);
    ASSERT(dev.console.block_reads.size() == 1, "One round-trip");
    ASSERT(dev.console.block_reads[0].start == 100 && dev.console.block_reads[0].count == 1,
           "Only block 100 fetched");
    ASSERT(data.size() == 10, "Ten bytes returned");
    ASSERT(data == dev.console.bytes_at(100, 0, 10), "First ten bytes of block 100");
}

void test_read_straddling_blocks() {
    std::cout << "\n=== Filesystem Tests: Read Across a Block Boundary ===\n";
    MountedDevice dev;

    std::vector<uint8_t> data = dev.fs.read("/8", 10, BS - 5);
    ASSERT(dev.console.block_reads.size() == 1, "One round-trip");
    ASSERT(dev.console.block_reads[0].start == 100 && dev.console.block_reads[0].count == 2,
           "Blocks 100 and 101 fetched together");
    ASSERT(data == dev.console.bytes_at(100, BS - 5, 10), "Bytes stitched across the boundary");
}

void test_read_bounds() {
    std::cout << "\n=== Filesystem Tests: Read Bounds ===\n";
    MountedDevice dev;
    const uint64_t size = 4 * BS;

    ASSERT(dev.fs.read("/8", 100, size).empty(), "Read at end is empty");
    ASSERT(dev.fs.read("/8", 100, size + 12345).empty(), "Read past end is empty");
    ASSERT(dev.console.commands.empty(), "Reads past end do no device I/O");

    std::vector<uint8_t> tail = dev.fs.read("/8", 100, size - 30);
    ASSERT(tail.size() == 30, "Read clamped at end of partition");
    ASSERT(tail == dev.console.bytes_at(103, BS - 30, 30), "Clamped bytes come from the last block");

    std::vector<uint8_t> all = dev.fs.read("/8", static_cast<size_t>(-1), 0);
    ASSERT(all.size() == size, "Huge size reads the whole partition");
    ASSERT(all == dev.console.bytes_at(100, 0, size), "Whole partition bytes");

    size_t issued = dev.console.commands.size();
    ASSERT(dev.fs.read("/8", 0, 7).empty(), "Zero-size read is empty");
    ASSERT(dev.fs.read("/1", 0, BS + 3).empty(), "Zero-size unaligned read is empty");
    ASSERT(dev.console.commands.size() == issued, "Zero-size reads do no device I/O");
    ASSERT_ERRNO(dev.fs.read("/5", 10, 0), ENOENT, "Read of unknown partition not found");
    ASSERT_ERRNO(dev.fs.read("/", 10, 0), ENOENT, "Read of root not found");
}

void test_read_into_buffer() {
    std::cout << "\n=== Filesystem Tests: Read Into Buffer ===\n";
    MountedDevice dev;
    const uint64_t size = 4 * BS;

    std::vector<char> buffer(64, 'z');
    size_t copied = dev.fs.read_into("/8", buffer.data(), 20, BS - 10);
    ASSERT(copied == 20, "Twenty bytes copied");
    std::vector<uint8_t> expected = dev.console.bytes_at(100, BS - 10, 20);
    ASSERT(std::equal(expected.begin(), expected.end(), reinterpret_cast<uint8_t*>(buffer.data())),
           "Copied bytes match the device");
    ASSERT(buffer[20] == 'z', "Nothing written past the copied range");

    std::vector<char> untouched(8, 'z');
    ASSERT(dev.fs.read_into("/8", untouched.data(), 8, size) == 0, "Read at end copies nothing");
    ASSERT(dev.fs.read_into("/8", untouched.data(), 0, 0) == 0, "Zero-size read copies nothing");
    ASSERT(untouched == std::vector<char>(8, 'z'), "Buffer untouched by empty reads");
    ASSERT_ERRNO(dev.fs.read_into("/4", untouched.data(), 8, 0), ENOENT, "Unknown partition not found");
}

void test_read_sizes_everywhere() {
    std::cout << "\n=== Filesystem Tests: Read Length Property ===\n";
    MountedDevice dev;
    const uint64_t part_size = 16 * BS;

    bool all_ok = true;
    for (uint64_t offset = 0; offset <= part_size + BS; offset += 317) {
        for (size_t size : {size_t(1), size_t(100), size_t(BS), size_t(3 * BS + 7)}) {
            std::vector<uint8_t> data = dev.fs.read("/1", size, offset);
            uint64_t expected = offset >= part_size ? 0 : std::min<uint64_t>(size, part_size - offset);
            if (data.size() != expected) all_ok = false;
            if (!data.empty() && data != dev.console.bytes_at(8, offset, data.size())) all_ok = false;
        }
    }
    ASSERT(all_ok, "Every read returns min(size, remaining) correct bytes");
    ASSERT(dev.console.block_reads.size() <= 16, "No block fetched twice");
    ASSERT(dev.fs.get_cache().cached_blocks() == 16, "Whole partition cached");
}

void test_read_after_desync() {
    std::cout << "\n=== Filesystem Tests: Desynchronized Console ===\n";
    MountedDevice dev;

    dev.fs.read("/8", 10, 0);
    dev.console.skip_dump_line = 3;

    bool desync = false;
    try {
        dev.fs.read("/8", 10, BS);
    } catch (const ProtocolError&) {
        desync = true;
    }
    ASSERT(desync, "Address gap surfaces as ProtocolError");
    ASSERT(dev.fs.read("/8", 10, 0) == dev.console.bytes_at(100, 0, 10), "Cached blocks still readable");
    ASSERT_THROWS(dev.fs.read("/8", 10, 2 * BS), "Uncached blocks fail after desync");
}

// ==========================================
// MAIN
// ==========================================
int main() {
    std::cout << "STARTING VDISK FILESYSTEM TEST SUITE\n";
    std::cout << "====================================\n";

    try {
        test_list_dir();
        test_get_attr();
        test_open();
        test_read_first_bytes();
        test_read_straddling_blocks();
        test_read_bounds();
        test_read_into_buffer();
        test_read_sizes_everywhere();
        test_read_after_desync();
    } catch (const std::exception& e) {
        std::cerr << "\n[CRITICAL FAILURE] Uncaught Exception: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n====================================\n";
    std::cout << "ALL VDISK FILESYSTEM TESTS PASSED.\n";
    return 0;
}
