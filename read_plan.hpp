#ifndef READ_PLAN_H
#define READ_PLAN_H

#include "chunk.hpp"
#include "chunk_store.hpp"

#include <cstdint>
#include <optional>
#include <vector>

// One step of a read: either fetch [start, end] from the backend (no chunk)
// or copy it from an already known chunk covering exactly [start, end].
struct ReadPlanEntry {
    std::uint64_t start{};
    std::uint64_t end{};
    std::optional<Chunk> chunk{};

    bool is_raw() const { return !chunk.has_value(); };
    std::uint64_t length() const { return end - start + 1; };
};

using ReadPlan = std::vector<ReadPlanEntry>;

// Entries are contiguous, ascending and cover [offset, offset + length - 1].
// Discarded chunks are skipped unless discard_is_zero. Throws
// std::invalid_argument if the range wraps around.
ReadPlan create_read_plan(const ChunkStore& store, std::uint64_t offset, std::uint64_t length,
                          bool discard_is_zero);

#endif
