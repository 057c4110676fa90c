#include "chunk_store.hpp"

void ChunkStore::insert(const Chunk& chunk, bool materialize) {
    std::size_t insert_at = 0;
    std::size_t i = 0;

    while (i < m_chunks.size()) {
        const Chunk& other = m_chunks[i];
        if (other.start() > chunk.end()) {
            break;
        }

        insert_at = other.start() < chunk.start() ? i + 1 : i;

        if (!chunk.intersects(other)) {
            ++i;
            continue;
        }

        if (other.included_in(chunk)) {
            m_chunks.erase(m_chunks.begin() + static_cast<std::ptrdiff_t>(i));
            continue;
        }

        std::vector<Chunk> remainder = other.cut(chunk);
        const std::size_t count = remainder.size();
        m_chunks.erase(m_chunks.begin() + static_cast<std::ptrdiff_t>(i));
        m_chunks.insert(m_chunks.begin() + static_cast<std::ptrdiff_t>(i), remainder.begin(), remainder.end());
        i += count;
    }

    if (materialize) {
        m_chunks.insert(m_chunks.begin() + static_cast<std::ptrdiff_t>(insert_at), chunk);
    }
}

std::vector<Chunk> ChunkStore::discarded_chunks() const {
    std::vector<Chunk> out;
    for (const auto& chunk : m_chunks) {
        if (chunk.is_discard()) {
            out.push_back(chunk);
        }
    }
    return out;
}
