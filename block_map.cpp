#include "block_map.hpp"

#include "disk.hpp"
#include "disk_error.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <utility>

namespace {

constexpr std::uint64_t CHECKSUM_READ_SIZE = 1024 * 1024;

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string to_hex(const unsigned char* bytes, unsigned int length) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0f]);
    }
    return out;
}

// Blocks entirely covered by discarded chunks, as inclusive block index runs.
std::vector<std::pair<std::uint64_t, std::uint64_t>> unmapped_blocks(const std::vector<Chunk>& discarded,
                                                                     std::uint32_t block_size,
                                                                     std::uint64_t capacity,
                                                                     std::uint64_t blocks_count) {
    std::vector<std::pair<std::uint64_t, std::uint64_t>> out;

    // adjacent discards together may cover a block neither covers alone
    std::vector<std::pair<std::uint64_t, std::uint64_t>> runs;
    for (const auto& chunk : discarded) {
        if (chunk.start() >= capacity) {
            break;
        }
        const std::uint64_t end = std::min(chunk.end(), capacity - 1);
        if (!runs.empty() && runs.back().second + 1 == chunk.start()) {
            runs.back().second = end;
        } else {
            runs.emplace_back(chunk.start(), end);
        }
    }

    for (const auto& run : runs) {
        const std::uint64_t first = (run.first + block_size - 1) / block_size;
        std::uint64_t past_last{};
        if (run.second == capacity - 1) {
            past_last = blocks_count;
        } else {
            past_last = (run.second + 1) / block_size;
        }
        if (first < past_last) {
            out.emplace_back(first, past_last - 1);
        }
    }
    return out;
}

bool checksum_range(Disk& disk, std::uint64_t start, std::uint64_t end, std::string& checksum,
                    std::error_code& ec) {
    DigestContext ctx{EVP_MD_CTX_new()};
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        std::cerr << "Failed to initialize SHA-256 context\n";
        ec = std::make_error_code(std::errc::not_enough_memory);
        return false;
    }

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(std::min(CHECKSUM_READ_SIZE, end - start)));
    std::uint64_t position = start;
    while (position < end) {
        const std::size_t length = static_cast<std::size_t>(std::min(CHECKSUM_READ_SIZE, end - position));
        std::size_t bytes_read{};
        if (!disk.read(buffer.data(), 0, length, position, bytes_read, ec)) {
            return false;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), length) != 1) {
            std::cerr << "SHA-256 update failed\n";
            ec = disk_errc::backend_io;
            return false;
        }
        position += length;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length{};
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        std::cerr << "SHA-256 finalization failed\n";
        ec = disk_errc::backend_io;
        return false;
    }
    checksum = to_hex(digest, digest_length);
    return true;
}

}

bool create_block_map(Disk& disk, std::uint32_t block_size, std::uint64_t capacity, bool calculate_checksums,
                      BlockMap& out, std::error_code& ec) {
    ec.clear();
    if (block_size == 0) {
        ec = disk_errc::invalid_argument;
        return false;
    }

    BlockMap map{};
    map.block_size = block_size;
    map.image_size = capacity;
    map.blocks_count = (capacity + block_size - 1) / block_size;
    map.checksum_type = calculate_checksums ? "sha256" : "";

    if (map.blocks_count == 0) {
        out = std::move(map);
        return true;
    }

    const auto unmapped = unmapped_blocks(disk.get_discarded_chunks(), block_size, capacity, map.blocks_count);

    std::uint64_t next = 0;
    auto add_range = [&map](std::uint64_t first, std::uint64_t last) {
        map.ranges.push_back(BlockRange{first, last, {}});
        map.mapped_blocks_count += last - first + 1;
    };
    for (const auto& hole : unmapped) {
        if (hole.first > next) {
            add_range(next, hole.first - 1);
        }
        next = hole.second + 1;
    }
    if (next < map.blocks_count) {
        add_range(next, map.blocks_count - 1);
    }

    if (calculate_checksums) {
        for (auto& range : map.ranges) {
            const std::uint64_t start = range.start_block * block_size;
            const std::uint64_t end = std::min((range.end_block + 1) * block_size, capacity);
            if (!checksum_range(disk, start, end, range.checksum, ec)) {
                return false;
            }
        }
    }

    out = std::move(map);
    return true;
}
