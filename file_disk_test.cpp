// file_disk_test.cpp - FileDisk over temporary image files
#include "file_disk.hpp"
#include "disk_error.hpp"
#include "test_disks.hpp"

#include <doctest/doctest.h>

#include <fcntl.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>

namespace {

// Removes the image when the test is done.
struct TempImage {
    std::filesystem::path path;

    TempImage(const std::string& name, const std::string& contents) {
        path = std::filesystem::temp_directory_path() / ("overlaydisk-" + name + ".img");
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << contents;
    }

    explicit TempImage(const std::string& name) {
        path = std::filesystem::temp_directory_path() / ("overlaydisk-" + name + ".img");
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    ~TempImage() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::string contents() const {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

DiskOptions writable() {
    DiskOptions options{};
    return options;
}

DiskOptions read_only_recording() {
    DiskOptions options{};
    options.read_only = true;
    options.record_writes = true;
    return options;
}

}

TEST_CASE("file disk: capacity is the file size") {
    TempImage image("capacity", std::string(1000, 'c'));
    FileDisk disk(image.path.string(), read_only_recording());
    std::error_code ec;
    REQUIRE(disk.open(ec));

    std::uint64_t capacity{};
    REQUIRE(disk.get_capacity(capacity, ec));
    CHECK(capacity == 1000);
}

TEST_CASE("file disk: positional reads") {
    TempImage image("reads", "0123456789abcdefghij");
    FileDisk disk(image.path.string(), read_only_recording());
    std::error_code ec;
    REQUIRE(disk.open(ec));

    std::vector<std::uint8_t> buffer(5);
    std::size_t bytes_read{};
    REQUIRE(disk.read(buffer.data(), 0, 5, 10, bytes_read, ec));
    CHECK(text_of(buffer) == "abcde");
    REQUIRE(disk.read(buffer.data(), 0, 5, 0, bytes_read, ec));
    CHECK(text_of(buffer) == "01234");
}

TEST_CASE("file disk: read past the end fails and the disk stays usable") {
    TempImage image("short", "0123456789");
    FileDisk disk(image.path.string(), read_only_recording());
    std::error_code ec;
    REQUIRE(disk.open(ec));

    std::vector<std::uint8_t> buffer(8);
    std::size_t bytes_read{};
    CHECK_FALSE(disk.read(buffer.data(), 0, 8, 6, bytes_read, ec));
    CHECK(ec == disk_errc::short_read);

    REQUIRE(disk.read(buffer.data(), 0, 4, 6, bytes_read, ec));
    CHECK(text_of(buffer).substr(0, 4) == "6789");
}

TEST_CASE("file disk: read-only disk keeps writes in memory") {
    TempImage image("readonly", "..........");
    FileDisk disk(image.path.string(), read_only_recording());
    std::error_code ec;
    REQUIRE(disk.open(ec));

    auto bytes = bytes_of("XY");
    std::size_t bytes_written{};
    REQUIRE(disk.write(bytes.data(), 0, 2, 3, bytes_written, ec));
    CHECK(bytes_written == 2);

    std::vector<std::uint8_t> buffer(10);
    std::size_t bytes_read{};
    REQUIRE(disk.read(buffer.data(), 0, 10, 0, bytes_read, ec));
    CHECK(text_of(buffer) == "...XY.....");

    REQUIRE(disk.flush(ec));
    disk.close();
    CHECK(image.contents() == "..........");
}

TEST_CASE("file disk: writable disk writes to the image") {
    TempImage image("writable", "..........");
    FileDisk disk(image.path.string(), writable());
    std::error_code ec;
    REQUIRE(disk.open(ec));

    auto bytes = bytes_of("abc");
    std::size_t bytes_written{};
    REQUIRE(disk.write(bytes.data(), 0, 3, 5, bytes_written, ec));
    REQUIRE(disk.flush(ec));
    CHECK(disk.known_chunks().empty());

    std::vector<std::uint8_t> buffer(10);
    std::size_t bytes_read{};
    REQUIRE(disk.read(buffer.data(), 0, 10, 0, bytes_read, ec));
    CHECK(text_of(buffer) == ".....abc..");

    disk.close();
    CHECK(image.contents() == ".....abc..");
}

TEST_CASE("file disk: missing image") {
    TempImage image("missing");

    SUBCASE("read-only open fails") {
        FileDisk disk(image.path.string(), read_only_recording());
        std::error_code ec;
        CHECK_FALSE(disk.open(ec));
        CHECK(ec == std::errc::no_such_file_or_directory);
        CHECK_FALSE(disk.is_open());
    }

    SUBCASE("writable open creates it with the minimum size") {
        FileDisk disk(image.path.string(), writable(), 10000);
        std::error_code ec;
        REQUIRE(disk.open(ec));

        std::uint64_t capacity{};
        REQUIRE(disk.get_capacity(capacity, ec));
        CHECK(capacity == 10000);

        std::vector<std::uint8_t> buffer(16, 0xff);
        std::size_t bytes_read{};
        REQUIRE(disk.read(buffer.data(), 0, 16, 9000, bytes_read, ec));
        CHECK(buffer == std::vector<std::uint8_t>(16, 0));
    }
}

TEST_CASE("file disk: closed disk reports not open") {
    TempImage image("closed", "abc");
    FileDisk disk(image.path.string(), read_only_recording());

    std::uint64_t capacity{};
    std::error_code ec;
    CHECK_FALSE(disk.get_capacity(capacity, ec));
    CHECK(ec == disk_errc::not_open);
}

TEST_CASE("file disk: flushed writes are visible to other readers") {
    TempImage image("flush", "................");
    FileDisk disk(image.path.string(), writable());
    std::error_code ec;
    REQUIRE(disk.open(ec));

    auto bytes = bytes_of("durable");
    std::size_t bytes_written{};
    REQUIRE(disk.write(bytes.data(), 0, bytes.size(), 4, bytes_written, ec));
    REQUIRE(disk.flush(ec));
    CHECK_FALSE(ec);

    // disk still open
    CHECK(image.contents() == "....durable.....");
}

TEST_CASE("file disk: wraps a descriptor opened by the caller") {
    TempImage image("wrapped", "0123456789");
    const int fd = ::open(image.path.c_str(), O_RDWR | O_CLOEXEC);
    REQUIRE(fd >= 0);

    {
        FileDisk disk(fd, writable());
        CHECK(disk.is_open());
        CHECK(disk.fd() == fd);
        std::error_code ec;
        REQUIRE(disk.open(ec));

        std::uint64_t capacity{};
        REQUIRE(disk.get_capacity(capacity, ec));
        CHECK(capacity == 10);

        auto bytes = bytes_of("AB");
        std::size_t bytes_written{};
        REQUIRE(disk.write(bytes.data(), 0, 2, 8, bytes_written, ec));
        REQUIRE(disk.flush(ec));

        std::vector<std::uint8_t> buffer(4);
        std::size_t bytes_read{};
        REQUIRE(disk.read(buffer.data(), 0, 4, 6, bytes_read, ec));
        CHECK(text_of(buffer) == "67AB");

        disk.close();
        CHECK_FALSE(disk.is_open());
    }

    // the caller still owns the descriptor
    char byte{};
    CHECK(::pread(fd, &byte, 1, 9) == 1);
    CHECK(byte == 'B');
    CHECK(::close(fd) == 0);
    CHECK(image.contents() == "01234567AB");
}

TEST_CASE("file disk: capacity comes from the open file") {
    TempImage image("replaced", std::string(100, 'a'));
    TempImage other("replacement", std::string(5000, 'b'));
    FileDisk disk(image.path.string(), read_only_recording());
    std::error_code ec;
    REQUIRE(disk.open(ec));

    std::filesystem::rename(other.path, image.path);

    std::uint64_t capacity{};
    REQUIRE(disk.get_capacity(capacity, ec));
    CHECK(capacity == 100);
}

TEST_CASE("file disk: invalid descriptor is not open") {
    FileDisk disk(-1, read_only_recording());
    std::error_code ec;
    CHECK_FALSE(disk.is_open());
    CHECK_FALSE(disk.open(ec));
    CHECK(ec == disk_errc::not_open);
}
