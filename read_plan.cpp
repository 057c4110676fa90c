#include "read_plan.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

ReadPlan create_read_plan(const ChunkStore& store, std::uint64_t offset, std::uint64_t length,
                          bool discard_is_zero) {
    ReadPlan plan;
    if (length == 0) {
        return plan;
    }
    if (length - 1 > std::numeric_limits<std::uint64_t>::max() - offset) {
        throw std::invalid_argument("read extends past the end of the address space");
    }

    const std::uint64_t end = offset + length - 1;
    std::uint64_t cursor = offset;

    for (const auto& chunk : store.chunks()) {
        if (chunk.start() > end) {
            break;
        }
        if (chunk.end() < offset) {
            continue;
        }
        if (chunk.is_discard() && !discard_is_zero) {
            continue;
        }

        const std::uint64_t a = std::max(chunk.start(), offset);
        const std::uint64_t b = std::min(chunk.end(), end);

        if (cursor < a) {
            plan.push_back(ReadPlanEntry{cursor, a - 1, std::nullopt});
        }
        plan.push_back(ReadPlanEntry{a, b, chunk.slice(a, b)});

        if (b == end) {
            return plan;
        }
        cursor = b + 1;
    }

    plan.push_back(ReadPlanEntry{cursor, end, std::nullopt});
    return plan;
}
