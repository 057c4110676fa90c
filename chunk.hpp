#ifndef CHUNK_H
#define CHUNK_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

enum class ChunkKind {
    DATA,
    DISCARD
};

// A part of a disk whose contents are already known: bytes that were written
// or read (DATA), or a discarded range that reads back as zeros (DISCARD).
// [start, end] is inclusive and never empty. Chunks are immutable, slices of
// a DATA chunk share its buffer.
class Chunk {
public:
    // Copies length bytes from buffer.
    static Chunk from_buffer(const std::uint8_t* buffer, std::size_t length, std::uint64_t offset);

    static Chunk discard(std::uint64_t offset, std::uint64_t length);

    std::uint64_t start() const { return m_start; };
    std::uint64_t end() const { return m_end; };
    std::uint64_t length() const { return m_end - m_start + 1; };
    std::pair<std::uint64_t, std::uint64_t> interval() const { return {m_start, m_end}; };

    ChunkKind kind() const { return m_kind; };
    bool is_discard() const { return m_kind == ChunkKind::DISCARD; };

    bool intersects(const Chunk& other) const;
    std::optional<std::pair<std::uint64_t, std::uint64_t>> intersection(const Chunk& other) const;
    bool included_in(const Chunk& other) const;

    // Parts of this chunk outside of other. other must overlap this chunk.
    std::vector<Chunk> cut(const Chunk& other) const;

    // a and b are disk offsets, start() <= a <= b <= end().
    Chunk slice(std::uint64_t a, std::uint64_t b) const;

    // Zeros are allocated here for DISCARD chunks, they are never stored.
    std::vector<std::uint8_t> data() const;

    // Writes length() bytes to dest.
    void copy_to(std::uint8_t* dest) const;

private:
    Chunk(ChunkKind kind, std::uint64_t start, std::uint64_t end,
          std::shared_ptr<const std::vector<std::uint8_t>> buffer, std::size_t buffer_offset);

    ChunkKind m_kind{ChunkKind::DATA};
    std::uint64_t m_start{};
    std::uint64_t m_end{};

    std::shared_ptr<const std::vector<std::uint8_t>> m_buffer{};
    std::size_t m_buffer_offset{};
};

#endif
