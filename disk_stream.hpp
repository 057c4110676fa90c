#ifndef DISK_STREAM_H
#define DISK_STREAM_H

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

class Disk;

constexpr std::size_t MIN_HIGH_WATER_MARK = 16;
constexpr std::size_t DEFAULT_HIGH_WATER_MARK = 16384;

// Sequential reader of [position, end) of a disk, one read per next() call.
// The disk must outlive the stream.
class DiskStream {
public:
    DiskStream(Disk& disk, std::uint64_t position, std::uint64_t end, std::size_t high_water_mark);

    // Returns false at the end of the stream (ec clear) or on error. An error
    // is final: every later call returns it again.
    bool next(std::vector<std::uint8_t>& out, std::error_code& ec);

    std::uint64_t position() const { return m_position; };
    std::uint64_t end() const { return m_end; };
    std::size_t high_water_mark() const { return m_high_water_mark; };
    bool ended() const { return m_position >= m_end; };
    const std::error_code& error() const { return m_error; };

private:
    Disk& m_disk;
    std::uint64_t m_position{};
    const std::uint64_t m_end{};
    const std::size_t m_high_water_mark{};
    std::error_code m_error{};
};

#endif
