#ifndef FORMAT_H
#define FORMAT_H

#include "chunk.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

constexpr std::size_t HEX_BYTES_PER_LINE = 16;

// "0000000000000010  41 42 43 ...  |ABC...|", at most HEX_BYTES_PER_LINE bytes.
std::string format_hex_line(std::uint64_t offset, const std::uint8_t* bytes, std::size_t count);

// Decimal or 0x hex, with an optional K, M or G (binary) suffix.
std::optional<std::uint64_t> parse_size(const std::string& text);

// "1.5 MiB"
std::string format_size(std::uint64_t bytes);

// Marker for the byte range [start, end] given sorted overlay chunks: 'M' if a
// data chunk held in memory overlaps it, 'D' if only discards do, ' ' otherwise.
char overlay_marker(const std::vector<Chunk>& chunks, std::uint64_t start, std::uint64_t end);

// "[10, 19] data, 10 bytes"
std::string describe_chunk(const Chunk& chunk);

#endif
