#include "disk.hpp"

#include "block_map.hpp"
#include "disk_error.hpp"

#include <algorithm>
#include <limits>

namespace {

bool range_fits(std::uint64_t offset, std::uint64_t length) {
    return length == 0 || length - 1 <= std::numeric_limits<std::uint64_t>::max() - offset;
}

}

Disk::Disk(const DiskOptions& options) : m_options{options}, m_block_mapper{create_block_map} {};

bool Disk::read(std::uint8_t* buffer, std::size_t buffer_offset, std::size_t length, std::uint64_t offset,
                std::size_t& bytes_read, std::error_code& ec) {
    ec.clear();
    bytes_read = 0;
    if (length == 0) {
        return true;
    }
    if (buffer == nullptr || !range_fits(offset, length)) {
        ec = disk_errc::invalid_argument;
        return false;
    }

    const ReadPlan plan = create_read_plan(m_chunks, offset, length, m_options.discard_is_zero);
    return read_according_to_plan(buffer + buffer_offset, offset, plan, bytes_read, ec);
}

bool Disk::read_according_to_plan(std::uint8_t* dest, std::uint64_t offset, const ReadPlan& plan,
                                  std::size_t& bytes_read, std::error_code& ec) {
    std::size_t copied = 0;

    // Strictly in order: a raw entry may record a chunk before the next entry runs.
    for (const auto& entry : plan) {
        std::uint8_t* out = dest + static_cast<std::size_t>(entry.start - offset);
        const std::size_t length = static_cast<std::size_t>(entry.length());

        if (!entry.is_raw()) {
            entry.chunk->copy_to(out);
            copied += length;
            continue;
        }

        if (!do_read(out, length, entry.start, ec)) {
            if (!ec) {
                ec = disk_errc::backend_io;
            }
            return false;
        }
        if (m_options.record_reads) {
            m_chunks.insert(Chunk::from_buffer(out, length, entry.start));
        }
        copied += length;
    }

    bytes_read = copied;
    return true;
}

bool Disk::write(const std::uint8_t* buffer, std::size_t buffer_offset, std::size_t length, std::uint64_t offset,
                 std::size_t& bytes_written, std::error_code& ec) {
    ec.clear();
    bytes_written = 0;
    if (length == 0) {
        return true;
    }
    if (buffer == nullptr || !range_fits(offset, length)) {
        ec = disk_errc::invalid_argument;
        return false;
    }

    if (m_options.record_writes) {
        m_chunks.insert(Chunk::from_buffer(buffer + buffer_offset, length, offset));
    } else {
        // Not recorded, but a write still invalidates any discard over these bytes.
        m_chunks.insert(Chunk::discard(offset, length), false);
    }

    if (m_options.read_only) {
        bytes_written = length;
        return true;
    }

    if (!do_write(buffer + buffer_offset, length, offset, ec)) {
        if (!ec) {
            ec = disk_errc::backend_io;
        }
        return false;
    }
    bytes_written = length;
    return true;
}

bool Disk::flush(std::error_code& ec) {
    ec.clear();
    if (m_options.read_only) {
        return true;
    }
    if (!do_flush(ec)) {
        if (!ec) {
            ec = disk_errc::backend_io;
        }
        return false;
    }
    return true;
}

bool Disk::discard(std::uint64_t offset, std::uint64_t length, std::error_code& ec) {
    ec.clear();
    if (length == 0) {
        return true;
    }
    if (!range_fits(offset, length)) {
        ec = disk_errc::invalid_argument;
        return false;
    }
    m_chunks.insert(Chunk::discard(offset, length));
    return true;
}

bool Disk::get_capacity(std::uint64_t& capacity, std::error_code& ec) {
    ec.clear();
    if (m_capacity) {
        capacity = *m_capacity;
        return true;
    }

    std::uint64_t value{};
    if (!do_get_capacity(value, ec)) {
        if (!ec) {
            ec = disk_errc::capacity_unavailable;
        }
        return false;
    }
    m_capacity = value;
    capacity = value;
    return true;
}

std::unique_ptr<DiskStream> Disk::get_stream(std::error_code& ec, const StreamOptions& options) {
    std::uint64_t end{};
    if (!get_capacity(end, ec)) {
        return nullptr;
    }
    if (options.length && options.position < end && *options.length < end - options.position) {
        end = options.position + *options.length;
    }
    return std::make_unique<DiskStream>(*this, options.position, end, options.high_water_mark);
}

bool Disk::get_block_map(std::uint32_t block_size, bool calculate_checksums, BlockMap& out, std::error_code& ec) {
    std::uint64_t capacity{};
    if (!get_capacity(capacity, ec)) {
        return false;
    }
    if (!m_block_mapper) {
        ec = disk_errc::not_supported;
        return false;
    }
    return m_block_mapper(*this, block_size, capacity, calculate_checksums, out, ec);
}

bool Disk::do_write(const std::uint8_t*, std::size_t, std::uint64_t, std::error_code& ec) {
    ec = disk_errc::not_supported;
    return false;
}

bool Disk::do_flush(std::error_code& ec) {
    ec = disk_errc::not_supported;
    return false;
}
