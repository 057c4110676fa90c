#include "chunk.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace {

// [offset, offset + length - 1] must not wrap around.
void check_range(std::uint64_t offset, std::uint64_t length) {
    if (length == 0) {
        throw std::invalid_argument("chunk length must be positive");
    }
    if (length - 1 > std::numeric_limits<std::uint64_t>::max() - offset) {
        throw std::invalid_argument("chunk extends past the end of the address space");
    }
}

}

Chunk::Chunk(ChunkKind kind, std::uint64_t start, std::uint64_t end,
             std::shared_ptr<const std::vector<std::uint8_t>> buffer, std::size_t buffer_offset)
    : m_kind{kind}, m_start{start}, m_end{end}, m_buffer{std::move(buffer)}, m_buffer_offset{buffer_offset} {};

Chunk Chunk::from_buffer(const std::uint8_t* buffer, std::size_t length, std::uint64_t offset) {
    check_range(offset, length);
    auto bytes = std::make_shared<const std::vector<std::uint8_t>>(buffer, buffer + length);
    return Chunk(ChunkKind::DATA, offset, offset + length - 1, std::move(bytes), 0);
}

Chunk Chunk::discard(std::uint64_t offset, std::uint64_t length) {
    check_range(offset, length);
    return Chunk(ChunkKind::DISCARD, offset, offset + length - 1, nullptr, 0);
}

bool Chunk::intersects(const Chunk& other) const {
    return m_start <= other.m_end && other.m_start <= m_end;
}

std::optional<std::pair<std::uint64_t, std::uint64_t>> Chunk::intersection(const Chunk& other) const {
    if (!intersects(other)) {
        return std::nullopt;
    }
    return std::make_pair(std::max(m_start, other.m_start), std::min(m_end, other.m_end));
}

bool Chunk::included_in(const Chunk& other) const {
    return m_start >= other.m_start && m_end <= other.m_end;
}

std::vector<Chunk> Chunk::cut(const Chunk& other) const {
    auto inter = intersection(other);
    if (!inter) {
        throw std::logic_error("cut() called with a non-overlapping chunk");
    }

    std::vector<Chunk> result;
    if (inter->first > m_start) {
        result.push_back(slice(m_start, inter->first - 1));
    }
    if (m_end > inter->second) {
        result.push_back(slice(inter->second + 1, m_end));
    }
    return result;
}

Chunk Chunk::slice(std::uint64_t a, std::uint64_t b) const {
    if (a < m_start || b > m_end || a > b) {
        throw std::out_of_range("slice outside of chunk");
    }
    if (m_kind == ChunkKind::DISCARD) {
        return Chunk(ChunkKind::DISCARD, a, b, nullptr, 0);
    }
    return Chunk(ChunkKind::DATA, a, b, m_buffer, m_buffer_offset + static_cast<std::size_t>(a - m_start));
}

std::vector<std::uint8_t> Chunk::data() const {
    std::vector<std::uint8_t> out(static_cast<std::size_t>(length()), 0);
    if (m_kind == ChunkKind::DATA) {
        copy_to(out.data());
    }
    return out;
}

void Chunk::copy_to(std::uint8_t* dest) const {
    const std::size_t n = static_cast<std::size_t>(length());
    if (m_kind == ChunkKind::DISCARD) {
        std::memset(dest, 0, n);
        return;
    }
    std::memcpy(dest, m_buffer->data() + m_buffer_offset, n);
}
