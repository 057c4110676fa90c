// block_map_test.cpp - block maps derived from discarded ranges
#include "block_map.hpp"
#include "disk.hpp"
#include "disk_error.hpp"
#include "test_disks.hpp"

#include <doctest/doctest.h>

namespace {

DiskOptions recording() {
    DiskOptions options{};
    options.read_only = true;
    options.record_writes = true;
    return options;
}

std::vector<Interval> block_ranges(const BlockMap& map) {
    std::vector<Interval> out;
    for (const auto& range : map.ranges) {
        out.emplace_back(range.start_block, range.end_block);
    }
    return out;
}

const char* SHA256_ABC = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

}

TEST_CASE("block map: nothing discarded maps every block") {
    MemoryDisk disk(std::vector<std::uint8_t>(10000), recording());
    BlockMap map;
    std::error_code ec;
    REQUIRE(disk.get_block_map(4096, false, map, ec));

    CHECK(map.block_size == 4096);
    CHECK(map.image_size == 10000);
    CHECK(map.blocks_count == 3);
    CHECK(map.mapped_blocks_count == 3);
    CHECK(map.checksum_type.empty());
    CHECK(block_ranges(map) == std::vector<Interval>{{0, 2}});
    CHECK(map.ranges[0].checksum.empty());
}

TEST_CASE("block map: discarded blocks are unmapped") {
    MemoryDisk disk(std::vector<std::uint8_t>(16 * 512), recording());

    SUBCASE("whole blocks") {
        discard_range(disk, 2 * 512, 3 * 512);
        BlockMap map;
        std::error_code ec;
        REQUIRE(disk.get_block_map(512, false, map, ec));
        CHECK(block_ranges(map) == std::vector<Interval>{{0, 1}, {5, 15}});
        CHECK(map.mapped_blocks_count == 13);
    }

    SUBCASE("partially covered blocks stay mapped") {
        discard_range(disk, 2 * 512 + 1, 3 * 512);
        BlockMap map;
        std::error_code ec;
        REQUIRE(disk.get_block_map(512, false, map, ec));
        CHECK(block_ranges(map) == std::vector<Interval>{{0, 2}, {5, 15}});
    }

    SUBCASE("adjacent discards cover a block together") {
        discard_range(disk, 512, 256);
        discard_range(disk, 768, 256);
        BlockMap map;
        std::error_code ec;
        REQUIRE(disk.get_block_map(512, false, map, ec));
        CHECK(block_ranges(map) == std::vector<Interval>{{0, 0}, {2, 15}});
    }

    SUBCASE("a write punches a hole") {
        discard_range(disk, 0, 16 * 512);
        auto bytes = bytes_of("x");
        std::size_t bytes_written{};
        std::error_code ec;
        REQUIRE(disk.write(bytes.data(), 0, 1, 7 * 512 + 100, bytes_written, ec));

        BlockMap map;
        REQUIRE(disk.get_block_map(512, false, map, ec));
        CHECK(block_ranges(map) == std::vector<Interval>{{7, 7}});
        CHECK(map.mapped_blocks_count == 1);
    }

    SUBCASE("everything discarded") {
        discard_range(disk, 0, 16 * 512);
        BlockMap map;
        std::error_code ec;
        REQUIRE(disk.get_block_map(512, false, map, ec));
        CHECK(map.ranges.empty());
        CHECK(map.mapped_blocks_count == 0);
        CHECK(map.blocks_count == 16);
    }
}

TEST_CASE("block map: partial last block") {
    MemoryDisk disk(std::vector<std::uint8_t>(1000), recording());
    discard_range(disk, 512, 488);

    BlockMap map;
    std::error_code ec;
    REQUIRE(disk.get_block_map(512, false, map, ec));
    CHECK(map.blocks_count == 2);
    CHECK(block_ranges(map) == std::vector<Interval>{{0, 0}});
}

TEST_CASE("block map: discards past the capacity are ignored") {
    MemoryDisk disk(std::vector<std::uint8_t>(1024), recording());
    discard_range(disk, 4096, 4096);

    BlockMap map;
    std::error_code ec;
    REQUIRE(disk.get_block_map(512, false, map, ec));
    CHECK(block_ranges(map) == std::vector<Interval>{{0, 1}});
}

TEST_CASE("block map: sha256 checksums") {
    SUBCASE("single range") {
        MemoryDisk disk(bytes_of("abc"), recording());
        BlockMap map;
        std::error_code ec;
        REQUIRE(disk.get_block_map(4096, true, map, ec));
        CHECK(map.checksum_type == "sha256");
        REQUIRE(map.ranges.size() == 1);
        CHECK(map.ranges[0].checksum == SHA256_ABC);
    }

    SUBCASE("range after an unmapped block") {
        MemoryDisk disk(bytes_of("xyzabc"), recording());
        discard_range(disk, 0, 3);
        BlockMap map;
        std::error_code ec;
        REQUIRE(disk.get_block_map(3, true, map, ec));
        REQUIRE(block_ranges(map) == std::vector<Interval>{{1, 1}});
        CHECK(map.ranges[0].checksum == SHA256_ABC);
    }

    SUBCASE("checksums include recorded writes") {
        MemoryDisk disk(bytes_of("xbc"), recording());
        auto bytes = bytes_of("a");
        std::size_t bytes_written{};
        std::error_code ec;
        REQUIRE(disk.write(bytes.data(), 0, 1, 0, bytes_written, ec));
        BlockMap map;
        REQUIRE(disk.get_block_map(512, true, map, ec));
        CHECK(map.ranges[0].checksum == SHA256_ABC);
    }

    SUBCASE("read failure") {
        MemoryDisk disk(bytes_of("abc"), recording());
        disk.fail_read_at = 1;
        BlockMap map;
        std::error_code ec;
        CHECK_FALSE(disk.get_block_map(512, true, map, ec));
        CHECK(ec == std::errc::io_error);
    }
}

TEST_CASE("block map: invalid block size") {
    MemoryDisk disk(std::vector<std::uint8_t>(1024), recording());
    BlockMap map;
    std::error_code ec;
    CHECK_FALSE(create_block_map(disk, 0, 1024, false, map, ec));
    CHECK(ec == disk_errc::invalid_argument);
}

TEST_CASE("block map: empty disk") {
    MemoryDisk disk(std::vector<std::uint8_t>{}, recording());
    BlockMap map;
    std::error_code ec;
    REQUIRE(disk.get_block_map(512, true, map, ec));
    CHECK(map.blocks_count == 0);
    CHECK(map.ranges.empty());
}
