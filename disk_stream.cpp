#include "disk_stream.hpp"

#include "disk.hpp"

#include <algorithm>

DiskStream::DiskStream(Disk& disk, std::uint64_t position, std::uint64_t end, std::size_t high_water_mark)
    : m_disk(disk), m_position{position}, m_end{end},
      m_high_water_mark{std::max(high_water_mark, MIN_HIGH_WATER_MARK)} {};

bool DiskStream::next(std::vector<std::uint8_t>& out, std::error_code& ec) {
    out.clear();
    if (m_error) {
        ec = m_error;
        return false;
    }
    ec.clear();
    if (ended()) {
        return false;
    }

    const std::size_t length =
        static_cast<std::size_t>(std::min<std::uint64_t>(m_high_water_mark, m_end - m_position));
    std::vector<std::uint8_t> buffer(length);
    std::size_t bytes_read{};
    if (!m_disk.read(buffer.data(), 0, length, m_position, bytes_read, ec)) {
        m_error = ec;
        return false;
    }

    m_position += length;
    out = std::move(buffer);
    return true;
}
