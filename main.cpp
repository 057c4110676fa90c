#include "file_disk.hpp"
#include "format.hpp"
#include "tui.hpp"

#include <iostream>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <image> [options]\n"
              << "  --writable             write through to the image (default: writes stay in memory)\n"
              << "  --no-record-writes     do not keep written data in memory\n"
              << "  --record-reads         keep data read from the image in memory\n"
              << "  --discard-passthrough  discarded ranges read from the image instead of zeros\n"
              << "  --create <size>        create or extend the image to size bytes (needs --writable)\n";
}

}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string path = argv[1];
    DiskOptions options{};
    options.read_only = true;
    options.record_writes = true;
    std::uint64_t min_size = 0;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--writable") {
            options.read_only = false;
        } else if (arg == "--no-record-writes") {
            options.record_writes = false;
        } else if (arg == "--record-reads") {
            options.record_reads = true;
        } else if (arg == "--discard-passthrough") {
            options.discard_is_zero = false;
        } else if (arg == "--create" && i + 1 < argc) {
            auto size = parse_size(argv[++i]);
            if (!size) {
                std::cerr << "Invalid size " << argv[i] << "\n";
                return 1;
            }
            min_size = *size;
        } else {
            std::cerr << "Unknown option " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (min_size > 0 && options.read_only) {
        std::cerr << "--create needs --writable\n";
        return 1;
    }

    FileDisk disk(path, options, min_size);
    std::error_code ec;
    if (!disk.open(ec)) {
        std::cerr << "Failed to open disk image: " << ec.message() << "\n";
        return 1;
    }

    std::uint64_t capacity{};
    if (!disk.get_capacity(capacity, ec)) {
        std::cerr << "Failed to get disk capacity: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "Opened " << path << " (" << format_size(capacity) << ")\n";

    run_tui(disk, capacity);

    if (!disk.flush(ec)) {
        std::cerr << "Failed to flush disk image: " << ec.message() << "\n";
        disk.close();
        return 1;
    }
    disk.close();
    return 0;
}
