#ifndef DISK_H
#define DISK_H

#include "chunk.hpp"
#include "chunk_store.hpp"
#include "disk_stream.hpp"
#include "read_plan.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

struct DiskOptions {
    // Writes never reach the backend, they only exist in the chunk store
    // (if record_writes).
    bool read_only{false};
    bool record_writes{false};
    // Keep what was read from the backend so later reads are served from memory.
    bool record_reads{false};
    // Discarded ranges read back as zeros. Otherwise discards are only
    // bookkeeping and reads of them go to the backend.
    bool discard_is_zero{true};
};

struct StreamOptions {
    std::uint64_t position{0};
    std::optional<std::uint64_t> length{};
    std::size_t high_water_mark{DEFAULT_HIGH_WATER_MARK};
};

class Disk;
struct BlockMap;

using BlockMapper = std::function<bool(Disk& disk, std::uint32_t block_size, std::uint64_t capacity,
                                       bool calculate_checksums, BlockMap& out, std::error_code& ec)>;

/*
 * A random access device over a backend, with an overlay of known chunks.
 *
 * Subclasses implement the backend hooks: do_get_capacity() and do_read(),
 * plus do_write() and do_flush() for writable backends.
 *
 * Not thread safe. Calls that mutate the chunk store (write, discard, read
 * with record_reads) must be serialized by the caller for a given instance.
 * AsyncDisk does that by running every call on one worker thread.
 */
class Disk {
public:
    explicit Disk(const DiskOptions& options);
    virtual ~Disk() = default;

    Disk(const Disk&) = delete;
    Disk& operator=(const Disk&) = delete;

    // Ranges that wrap around the 64 bit address space fail with
    // disk_errc::invalid_argument.

    // Reads length bytes at offset into buffer + buffer_offset.
    // On failure the contents of buffer are unspecified.
    bool read(std::uint8_t* buffer, std::size_t buffer_offset, std::size_t length, std::uint64_t offset,
              std::size_t& bytes_read, std::error_code& ec);

    bool write(const std::uint8_t* buffer, std::size_t buffer_offset, std::size_t length, std::uint64_t offset,
               std::size_t& bytes_written, std::error_code& ec);

    bool flush(std::error_code& ec);

    // Only recorded in the chunk store, the backend is never told.
    bool discard(std::uint64_t offset, std::uint64_t length, std::error_code& ec);

    // The first successful result is kept for the lifetime of the disk.
    bool get_capacity(std::uint64_t& capacity, std::error_code& ec);

    // nullptr if the capacity is unavailable.
    std::unique_ptr<DiskStream> get_stream(std::error_code& ec, const StreamOptions& options = {});

    bool get_block_map(std::uint32_t block_size, bool calculate_checksums, BlockMap& out, std::error_code& ec);

    // Replaces create_block_map() as the get_block_map() collaborator.
    void set_block_mapper(BlockMapper mapper) { m_block_mapper = std::move(mapper); };

    std::vector<Chunk> get_discarded_chunks() const { return m_chunks.discarded_chunks(); };

    const std::vector<Chunk>& known_chunks() const { return m_chunks.chunks(); };

    const DiskOptions& options() const { return m_options; };

protected:
    virtual bool do_get_capacity(std::uint64_t& capacity, std::error_code& ec) = 0;

    // Must fill exactly length bytes or fail.
    virtual bool do_read(std::uint8_t* buffer, std::size_t length, std::uint64_t offset, std::error_code& ec) = 0;

    virtual bool do_write(const std::uint8_t* buffer, std::size_t length, std::uint64_t offset,
                          std::error_code& ec);

    virtual bool do_flush(std::error_code& ec);

private:
    const DiskOptions m_options;
    ChunkStore m_chunks{};
    std::optional<std::uint64_t> m_capacity{};
    BlockMapper m_block_mapper;

    bool read_according_to_plan(std::uint8_t* dest, std::uint64_t offset, const ReadPlan& plan,
                                std::size_t& bytes_read, std::error_code& ec);
};

#endif
