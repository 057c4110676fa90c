#ifndef ASYNC_DISK_H
#define ASYNC_DISK_H

#include "disk.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <system_error>
#include <thread>

// Single worker thread running submitted tasks in FIFO order.
class IoWorker {
public:
    IoWorker();
    ~IoWorker();

    IoWorker(const IoWorker&) = delete;
    IoWorker& operator=(const IoWorker&) = delete;

    void submit(std::function<void()> task);

private:
    void run();

    std::thread m_thread;
    std::deque<std::function<void()>> m_tasks{};
    std::mutex m_mutex{};
    std::condition_variable m_cv{};
    bool m_stop{false};
};

struct IoResult {
    std::error_code error{};
    std::size_t bytes{};
};

struct CapacityResult {
    std::error_code error{};
    std::uint64_t capacity{};
};

/*
 * Runs every operation of a Disk on one worker thread and returns futures.
 *
 * Operations complete in submission order, so the chunk store is never
 * mutated concurrently. The disk must outlive this object, and must not be
 * used directly while operations are pending. Buffers passed to read() and
 * write() must stay valid until the future is ready.
 */
class AsyncDisk {
public:
    explicit AsyncDisk(Disk& disk) : m_disk(disk) {};

    std::future<IoResult> read(std::uint8_t* buffer, std::size_t buffer_offset, std::size_t length,
                               std::uint64_t offset);

    std::future<IoResult> write(const std::uint8_t* buffer, std::size_t buffer_offset, std::size_t length,
                                std::uint64_t offset);

    std::future<std::error_code> flush();

    std::future<std::error_code> discard(std::uint64_t offset, std::uint64_t length);

    std::future<CapacityResult> get_capacity();

private:
    template <class T>
    std::future<T> enqueue(std::function<T()> work);

    Disk& m_disk;
    IoWorker m_worker{};
};

#endif
