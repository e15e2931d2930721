#define FUSE_USE_VERSION 31

#include "vdisk/console_protocol.hpp"
#include "vdisk/errors.hpp"
#include "vdisk/serial_transport.hpp"
#include "vdisk/vdisk_filesystem.hpp"
#include <fuse.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace {

VdiskFilesystem* current_fs() {
    return static_cast<VdiskFilesystem*>(fuse_get_context()->private_data);
}

// Nothing may escape into libfuse; errors become negative errno values.
template <typename Op>
int guarded(Op op) {
    try {
        return op();
    } catch (const FsError& e) {
        return -e.error_code();
    } catch (const std::exception& e) {
        std::cerr << "[Error] " << e.what() << "\n";
        return -EIO;
    }
}

int vdisk_getattr(const char* path, struct stat* st, struct fuse_file_info*) {
    return guarded([&]() {
        FileAttr attr = current_fs()->get_attr(path);
        std::memset(st, 0, sizeof(*st));
        st->st_mode = attr.mode;
        st->st_nlink = attr.nlink;
        st->st_size = static_cast<off_t>(attr.size);
        return 0;
    });
}

int vdisk_readdir(const char* path, void* buf, fuse_fill_dir_t filler, off_t,
                  struct fuse_file_info*, enum fuse_readdir_flags) {
    return guarded([&]() {
        std::vector<std::string> entries = current_fs()->list_dir(path);
        filler(buf, ".", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
        filler(buf, "..", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
        for (const auto& name : entries) {
            filler(buf, name.c_str(), nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
        }
        return 0;
    });
}

int vdisk_open(const char* path, struct fuse_file_info* fi) {
    return guarded([&]() {
        fi->fh = current_fs()->open(path, fi->flags);
        return 0;
    });
}

int vdisk_read(const char* path, char* buf, size_t size, off_t offset, struct fuse_file_info*) {
    if (offset < 0) return -EINVAL;
    return guarded([&]() {
        return static_cast<int>(current_fs()->read_into(path, buf, size, static_cast<uint64_t>(offset)));
    });
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " /path/to/mountpoint /dev/serial [--staging-address=<hex>]\n";
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

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return 2;
    }

    std::unique_ptr<SerialTransport> transport;
    std::unique_ptr<ConsoleProtocol> protocol;
    std::unique_ptr<VdiskFilesystem> fs;
    try {
        transport = std::make_unique<SerialTransport>(positional[1]);
        protocol = std::make_unique<ConsoleProtocol>(*transport, console_config);
        fs = std::make_unique<VdiskFilesystem>(*protocol, protocol->discover());
    } catch (const std::exception& e) {
        std::cerr << "[Critical Error] " << e.what() << "\n";
        return 1;
    }

    struct fuse_operations ops;
    std::memset(&ops, 0, sizeof(ops));
    ops.getattr = vdisk_getattr;
    ops.readdir = vdisk_readdir;
    ops.open = vdisk_open;
    ops.read = vdisk_read;

    // The console carries one command at a time: single-threaded, foreground.
    std::vector<std::string> fuse_args = {
        argv[0], positional[0], "-f", "-s", "-o", "ro,fsname=uboot-vdisk"
    };
    std::vector<char*> fuse_argv;
    for (auto& arg : fuse_args) fuse_argv.push_back(&arg[0]);

    std::cout << "[System] Mounting " << fs->get_partitions().size() << " partitions at '"
              << positional[0] << "'\n";
    return fuse_main(static_cast<int>(fuse_argv.size()), fuse_argv.data(), &ops, fs.get());
}
