#ifndef CHUNK_STORE_H
#define CHUNK_STORE_H

#include "chunk.hpp"

#include <cstddef>
#include <vector>

// Sorted by start, no two chunks overlap. In memory only.
class ChunkStore {
public:
    // Existing chunks overlapping chunk are removed or cut down to the parts
    // outside of it. chunk itself is only added if materialize is true.
    void insert(const Chunk& chunk, bool materialize = true);

    const std::vector<Chunk>& chunks() const { return m_chunks; };

    std::vector<Chunk> discarded_chunks() const;

    std::size_t size() const { return m_chunks.size(); };
    bool empty() const { return m_chunks.empty(); };
    void clear() { m_chunks.clear(); };

private:
    std::vector<Chunk> m_chunks{};
};

#endif
