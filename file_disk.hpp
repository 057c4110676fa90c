#ifndef FILE_DISK_H
#define FILE_DISK_H

#include "disk.hpp"

#include <cstdint>
#include <string>
#include <system_error>

// Disk backed by an image file or block device, through a POSIX descriptor.
class FileDisk : public Disk {
public:
    // min_size: when writable, a missing image is created and a shorter one
    // is extended with zeros up to this size.
    FileDisk(const std::string& path, const DiskOptions& options, std::uint64_t min_size = 0);

    // Wraps a descriptor opened by the caller, who keeps ownership: close()
    // and the destructor never close it.
    FileDisk(int fd, const DiskOptions& options);

    ~FileDisk() override;

    // Opens the path. For a wrapped descriptor only checks that it is valid.
    bool open(std::error_code& ec);

    void close();

    bool is_open() const { return m_fd >= 0; };

    int fd() const { return m_fd; };

    const std::string& path() const { return m_path; };

protected:
    bool do_get_capacity(std::uint64_t& capacity, std::error_code& ec) override;
    bool do_read(std::uint8_t* buffer, std::size_t length, std::uint64_t offset, std::error_code& ec) override;
    bool do_write(const std::uint8_t* buffer, std::size_t length, std::uint64_t offset,
                  std::error_code& ec) override;
    // fdatasync(), the data is on stable storage once this returns true.
    bool do_flush(std::error_code& ec) override;

private:
    int m_fd{-1};
    bool m_owns_fd{false};
    const std::string m_path{};
    const std::uint64_t m_min_size{};

    bool ensure_size(std::error_code& ec);
};

#endif
