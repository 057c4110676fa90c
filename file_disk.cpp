#include "file_disk.hpp"

#include "disk_error.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <iostream>
#include <vector>

namespace {

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

}

FileDisk::FileDisk(const std::string& path, const DiskOptions& options, std::uint64_t min_size)
    : Disk(options), m_path{path}, m_min_size{min_size} {};

FileDisk::FileDisk(int fd, const DiskOptions& options) : Disk(options), m_fd{fd} {};

FileDisk::~FileDisk() {
    close();
}

bool FileDisk::open(std::error_code& ec) {
    ec.clear();
    if (m_fd >= 0) {
        return true;
    }
    if (m_path.empty()) {
        ec = disk_errc::not_open;
        return false;
    }

    const bool read_only = options().read_only;
    const int flags = read_only ? O_RDONLY | O_CLOEXEC : O_RDWR | O_CREAT | O_CLOEXEC;
    const int fd = ::open(m_path.c_str(), flags, 0644);
    if (fd < 0) {
        ec = last_error();
        std::cerr << "Failed to open disk image at path " << m_path << ": " << ec.message() << "\n";
        return false;
    }
    m_fd = fd;
    m_owns_fd = true;

    if (!read_only && !ensure_size(ec)) {
        std::cerr << "Could not allocate size for disk image\n";
        close();
        return false;
    }
    return true;
}

bool FileDisk::ensure_size(std::error_code& ec) {
    std::uint64_t current_size{};
    if (!do_get_capacity(current_size, ec)) {
        return false;
    }
    if (current_size >= m_min_size) {
        return true;
    }

    std::vector<std::uint8_t> zeros(4096, 0);
    while (current_size < m_min_size) {
        const std::size_t chunk =
            static_cast<std::size_t>(std::min<std::uint64_t>(m_min_size - current_size, zeros.size()));
        if (!do_write(zeros.data(), chunk, current_size, ec)) {
            std::cerr << "Failed to extend disk image\n";
            return false;
        }
        current_size += chunk;
    }

    std::cout << "Disk image size after initialization: " << current_size << "\n";
    return true;
}

void FileDisk::close() {
    if (m_fd >= 0 && m_owns_fd) {
        if (::close(m_fd) != 0) {
            std::cerr << "Closing disk image " << m_path << " failed: " << last_error().message() << "\n";
        }
    }
    m_fd = -1;
    m_owns_fd = false;
}

bool FileDisk::do_get_capacity(std::uint64_t& capacity, std::error_code& ec) {
    if (m_fd < 0) {
        ec = disk_errc::not_open;
        return false;
    }
    struct stat st {};
    if (::fstat(m_fd, &st) != 0) {
        ec = last_error();
        std::cerr << "Failed to get size of disk image " << m_path << ": " << ec.message() << "\n";
        return false;
    }
    capacity = static_cast<std::uint64_t>(st.st_size);
    return true;
}

bool FileDisk::do_read(std::uint8_t* buffer, std::size_t length, std::uint64_t offset, std::error_code& ec) {
    if (m_fd < 0) {
        std::cerr << "Disk is not open\n";
        ec = disk_errc::not_open;
        return false;
    }

    std::size_t done = 0;
    while (done < length) {
        const ssize_t n = ::pread(m_fd, buffer + done, length - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ec = last_error();
            std::cerr << "Read of " << length << " bytes at " << offset << " failed: " << ec.message() << "\n";
            return false;
        }
        if (n == 0) {
            std::cerr << "Read of " << length << " bytes at " << offset << " hit the end of the image\n";
            ec = disk_errc::short_read;
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

bool FileDisk::do_write(const std::uint8_t* buffer, std::size_t length, std::uint64_t offset,
                        std::error_code& ec) {
    if (m_fd < 0) {
        std::cerr << "Disk is not open\n";
        ec = disk_errc::not_open;
        return false;
    }

    std::size_t done = 0;
    while (done < length) {
        const ssize_t n = ::pwrite(m_fd, buffer + done, length - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ec = last_error();
            std::cerr << "Write of " << length << " bytes at " << offset << " failed: " << ec.message() << "\n";
            return false;
        }
        if (n == 0) {
            std::cerr << "Write of " << length << " bytes at " << offset << " made no progress\n";
            ec = disk_errc::backend_io;
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

bool FileDisk::do_flush(std::error_code& ec) {
    if (m_fd < 0) {
        ec = disk_errc::not_open;
        return false;
    }
    if (::fdatasync(m_fd) != 0) {
        ec = last_error();
        std::cerr << "Flushing disk image " << m_path << " failed: " << ec.message() << "\n";
        return false;
    }
    return true;
}
