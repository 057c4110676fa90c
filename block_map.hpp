#ifndef BLOCK_MAP_H
#define BLOCK_MAP_H

#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

class Disk;

// Inclusive run of mapped blocks.
struct BlockRange {
    std::uint64_t start_block{};
    std::uint64_t end_block{};
    std::string checksum{};   // hex, empty without checksums
};

struct BlockMap {
    std::uint32_t block_size{};
    std::uint64_t image_size{};
    std::uint64_t blocks_count{};
    std::uint64_t mapped_blocks_count{};
    std::string checksum_type{};   // "sha256" or empty
    std::vector<BlockRange> ranges{};
};

/*
 * Default Disk::get_block_map() collaborator.
 *
 * A block is unmapped when discarded chunks cover all of it, every other
 * block is mapped. With calculate_checksums the bytes of each range are read
 * through disk.read() and hashed with SHA-256.
 */
bool create_block_map(Disk& disk, std::uint32_t block_size, std::uint64_t capacity, bool calculate_checksums,
                      BlockMap& out, std::error_code& ec);

#endif
