// async_disk_test.cpp - Disk operations on the worker thread
#include "async_disk.hpp"
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

}

TEST_CASE("async disk: capacity") {
    MemoryDisk disk(std::vector<std::uint8_t>(4096), recording());
    AsyncDisk async(disk);

    auto result = async.get_capacity().get();
    CHECK_FALSE(result.error);
    CHECK(result.capacity == 4096);
}

TEST_CASE("async disk: operations run in submission order") {
    MemoryDisk disk(std::vector<std::uint8_t>(32, '.'), recording());
    AsyncDisk async(disk);

    auto first = bytes_of("aaaa");
    auto second = bytes_of("bb");
    std::vector<std::uint8_t> buffer(8);

    auto w1 = async.write(first.data(), 0, first.size(), 0);
    auto d = async.discard(6, 2);
    auto w2 = async.write(second.data(), 0, second.size(), 2);
    auto r = async.read(buffer.data(), 0, buffer.size(), 0);
    auto f = async.flush();

    CHECK(w1.get().bytes == 4);
    CHECK_FALSE(d.get());
    CHECK(w2.get().bytes == 2);

    auto read = r.get();
    CHECK_FALSE(read.error);
    CHECK(read.bytes == 8);
    CHECK(text_of(buffer) == std::string("aabb..") + '\0' + '\0');

    CHECK_FALSE(f.get());
    CHECK(disk.flush_calls == 0);
}

TEST_CASE("async disk: errors come back in the result") {
    MemoryDisk disk(std::vector<std::uint8_t>(64), recording());
    disk.fail_read_at = 10;
    AsyncDisk async(disk);

    std::vector<std::uint8_t> buffer(16);
    auto result = async.read(buffer.data(), 0, buffer.size(), 0).get();
    CHECK(result.error == std::errc::io_error);
    CHECK(result.bytes == 0);
}

TEST_CASE("async disk: pending work finishes before destruction") {
    MemoryDisk disk(std::vector<std::uint8_t>(1024, 0), recording());
    auto bytes = bytes_of("z");
    std::vector<std::future<IoResult>> writes;
    {
        AsyncDisk async(disk);
        for (std::uint64_t offset = 0; offset < 100; ++offset) {
            writes.push_back(async.write(bytes.data(), 0, 1, offset * 2));
        }
    }

    for (auto& write : writes) {
        CHECK(write.get().bytes == 1);
    }
    CHECK(disk.known_chunks().size() == 100);
}
