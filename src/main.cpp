#include "vdisk/console_protocol.hpp"
#include "vdisk/errors.hpp"
#include "vdisk/serial_transport.hpp"
#include "vdisk/vdisk_filesystem.hpp"
#include "util/tokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

const size_t EXPORT_CHUNK = 64 * 1024;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " /dev/serial [--staging-address=<hex>]\n";
}

// Decimal, or hex with a 0x prefix
uint64_t parse_number(const std::string& text) {
    uint64_t value = 0;
    bool ok = (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
                  ? parse_hex(text, value)
                  : parse_decimal(text, value);
    if (!ok) throw std::invalid_argument("Not a number: " + text);
    return value;
}

std::string format_mode(const FileAttr& attr) {
    std::string res = attr.is_directory() ? "d" : "-";
    for (int shift = 6; shift >= 0; shift -= 3) {
        res += (attr.mode & (4 << shift)) ? 'r' : '-';
        res += (attr.mode & (2 << shift)) ? 'w' : '-';
        res += (attr.mode & (1 << shift)) ? 'x' : '-';
    }
    return res;
}

// Same layout U-Boot's md.b uses
void hex_dump(const std::vector<uint8_t>& data, uint64_t base) {
    for (size_t line = 0; line < data.size(); line += 16) {
        std::ostringstream hex, text;
        for (size_t i = line; i < line + 16; i++) {
            if (i < data.size()) {
                hex << " " << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
                text << (std::isprint(data[i]) ? static_cast<char>(data[i]) : '.');
            } else {
                hex << "   ";
            }
        }
        std::cout << std::hex << std::setw(8) << std::setfill('0') << (base + line) << std::dec
                  << ":" << hex.str() << "    " << text.str() << "\n";
    }
}

void export_range(VdiskFilesystem& fs, const std::string& path, const std::string& out_file,
                  uint64_t offset, uint64_t size) {
    std::ofstream out(out_file, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot open output file: " + out_file);

    uint64_t copied = 0;
    while (copied < size) {
        size_t chunk = static_cast<size_t>(std::min<uint64_t>(EXPORT_CHUNK, size - copied));
        std::vector<uint8_t> data = fs.read(path, chunk, offset + copied);
        if (data.empty()) break;

        out.write(reinterpret_cast<const char*>(data.data()), data.size());
        if (!out) throw std::runtime_error("Write failed: " + out_file);
        copied += data.size();
        std::cout << "\r[System] " << copied << " / " << size << " bytes" << std::flush;
    }
    std::cout << "\n[System] Exported " << copied << " bytes of " << path << " to '" << out_file << "'\n";
}

void print_help() {
    std::cout << "Commands:\n"
              << "  ls [path]                              list partitions\n"
              << "  stat <path>                            show attributes\n"
              << "  hexdump <path> <offset> <size>         dump a byte range\n"
              << "  export <path> <file> [offset size]     copy bytes to a local file\n"
              << "  cache                                  block cache statistics\n"
              << "  exit\n";
}

} // namespace

int main(int argc, char** argv) {
    ConsoleConfig console_config;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (!console_config.apply_option(arg)) positional.push_back(arg);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Error] " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    if (positional.size() != 1) {
        print_usage(argv[0]);
        return 2;
    }

    // 1. Bring up the console and learn the device layout
    std::unique_ptr<SerialTransport> transport;
    DeviceGeometry geometry;
    std::unique_ptr<ConsoleProtocol> protocol;
    try {
        std::cout << "[System] Opening '" << positional[0] << "'...\n";
        transport = std::make_unique<SerialTransport>(positional[0]);
        protocol = std::make_unique<ConsoleProtocol>(*transport, console_config);
        geometry = protocol->discover();
    } catch (const std::exception& e) {
        std::cerr << "[Critical Error] " << e.what() << "\n";
        return 1;
    }

    VdiskFilesystem fs(*protocol, geometry);

    std::cout << "\n=== U-Boot MMC Shell ===\n";
    print_help();

    // 2. REPL Loop
    std::string line;
    while (true) {
        std::cout << "\nvdisk> ";

        if (!std::getline(std::cin, line)) break;
        std::vector<std::string> args = split_words(line);
        if (args.empty()) continue;
        std::string cmd = args[0];

        try {
            if (cmd == "exit") {
                break;
            }
            else if (cmd == "help") {
                print_help();
            }
            else if (cmd == "ls") {
                std::string path = (args.size() > 1) ? args[1] : "/";
                for (const auto& name : fs.list_dir(path)) {
                    FileAttr attr = fs.get_attr("/" + name);
                    const Partition* p = nullptr;
                    uint64_t number = 0;
                    if (parse_decimal(name, number)) p = fs.get_partitions().find(static_cast<uint32_t>(number));
                    if (p == nullptr) throw std::runtime_error("Partition vanished: " + name);
                    std::cout << format_mode(attr) << "  " << std::setw(12) << attr.size
                              << "  " << std::setw(4) << name
                              << "  (blocks " << p->start << "+" << p->length << ")\n";
                }
            }
            else if (cmd == "stat") {
                if (args.size() < 2) throw std::runtime_error("Usage: stat <path>");
                FileAttr attr = fs.get_attr(args[1]);
                std::cout << format_mode(attr) << "  links=" << attr.nlink << "  size=" << attr.size << "\n";
            }
            else if (cmd == "hexdump") {
                if (args.size() < 4) throw std::runtime_error("Usage: hexdump <path> <offset> <size>");
                uint64_t offset = parse_number(args[2]);
                uint64_t size = parse_number(args[3]);
                fs.open(args[1], O_RDONLY);
                hex_dump(fs.read(args[1], static_cast<size_t>(size), offset), offset);
            }
            else if (cmd == "export") {
                if (args.size() != 3 && args.size() != 5) {
                    throw std::runtime_error("Usage: export <path> <file> [offset size]");
                }
                FileAttr attr = fs.get_attr(args[1]);
                fs.open(args[1], O_RDONLY);
                uint64_t offset = (args.size() == 5) ? parse_number(args[3]) : 0;
                uint64_t size = (args.size() == 5) ? parse_number(args[4]) : attr.size;
                export_range(fs, args[1], args[2], offset, size);
            }
            else if (cmd == "cache") {
                const CacheStats& stats = fs.get_cache().get_stats();
                std::cout << "Cached blocks: " << fs.get_cache().cached_blocks() << "\n"
                          << "Hits:          " << stats.hits << "\n"
                          << "Misses:        " << stats.misses << "\n"
                          << "Round-trips:   " << stats.fetches << "\n";
            }
            else {
                std::cout << "Unknown command: " << cmd << "\n";
            }

        } catch (const ProtocolError& e) {
            std::cout << "[Error] " << e.what() << "\n";
            std::cout << "[System] The console is out of step; further reads will fail.\n";
        } catch (const std::exception& e) {
            std::cout << "[Error] " << e.what() << "\n";
        }
    }

    return 0;
}
