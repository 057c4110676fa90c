#include "async_disk.hpp"

#include <memory>
#include <utility>

IoWorker::IoWorker() {
    m_thread = std::thread([this] { run(); });
}

IoWorker::~IoWorker() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_one();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void IoWorker::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.push_back(std::move(task));
    }
    m_cv.notify_one();
}

void IoWorker::run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
            // drain the queue before stopping
            if (m_stop && m_tasks.empty()) {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }
        task();
    }
}

template <class T>
std::future<T> AsyncDisk::enqueue(std::function<T()> work) {
    auto task = std::make_shared<std::packaged_task<T()>>(std::move(work));
    std::future<T> result = task->get_future();
    m_worker.submit([task] { (*task)(); });
    return result;
}

std::future<IoResult> AsyncDisk::read(std::uint8_t* buffer, std::size_t buffer_offset, std::size_t length,
                                      std::uint64_t offset) {
    return enqueue<IoResult>([this, buffer, buffer_offset, length, offset] {
        IoResult result{};
        m_disk.read(buffer, buffer_offset, length, offset, result.bytes, result.error);
        return result;
    });
}

std::future<IoResult> AsyncDisk::write(const std::uint8_t* buffer, std::size_t buffer_offset, std::size_t length,
                                       std::uint64_t offset) {
    return enqueue<IoResult>([this, buffer, buffer_offset, length, offset] {
        IoResult result{};
        m_disk.write(buffer, buffer_offset, length, offset, result.bytes, result.error);
        return result;
    });
}

std::future<std::error_code> AsyncDisk::flush() {
    return enqueue<std::error_code>([this] {
        std::error_code ec;
        m_disk.flush(ec);
        return ec;
    });
}

std::future<std::error_code> AsyncDisk::discard(std::uint64_t offset, std::uint64_t length) {
    return enqueue<std::error_code>([this, offset, length] {
        std::error_code ec;
        m_disk.discard(offset, length, ec);
        return ec;
    });
}

std::future<CapacityResult> AsyncDisk::get_capacity() {
    return enqueue<CapacityResult>([this] {
        CapacityResult result{};
        m_disk.get_capacity(result.capacity, result.error);
        return result;
    });
}
