#include "object_disk.hpp"

#include "disk_error.hpp"

#include <cstring>
#include <iostream>

namespace {

DiskOptions object_disk_options(bool record_reads, bool discard_is_zero) {
    DiskOptions options{};
    options.read_only = true;
    options.record_writes = true;
    options.record_reads = record_reads;
    options.discard_is_zero = discard_is_zero;
    return options;
}

}

std::string http_byte_range(std::uint64_t first, std::uint64_t last) {
    return "bytes=" + std::to_string(first) + "-" + std::to_string(last);
}

ObjectDisk::ObjectDisk(std::shared_ptr<ObjectStorageClient> client, std::string bucket, std::string key,
                       bool record_reads, bool discard_is_zero)
    : Disk(object_disk_options(record_reads, discard_is_zero)), m_client{std::move(client)},
      m_bucket{std::move(bucket)}, m_key{std::move(key)} {};

bool ObjectDisk::do_get_capacity(std::uint64_t& capacity, std::error_code& ec) {
    if (!m_client) {
        ec = disk_errc::not_open;
        return false;
    }
    if (!m_client->head_object(m_bucket, m_key, capacity, ec)) {
        std::cerr << "HEAD " << m_bucket << "/" << m_key << " failed: " << ec.message() << "\n";
        return false;
    }
    return true;
}

bool ObjectDisk::do_read(std::uint8_t* buffer, std::size_t length, std::uint64_t offset, std::error_code& ec) {
    if (!m_client) {
        ec = disk_errc::not_open;
        return false;
    }

    const std::uint64_t last = offset + length - 1;
    std::vector<std::uint8_t> body;
    if (!m_client->get_object_range(m_bucket, m_key, offset, last, body, ec)) {
        std::cerr << "GET " << m_bucket << "/" << m_key << " " << http_byte_range(offset, last)
                  << " failed: " << ec.message() << "\n";
        return false;
    }
    if (body.size() != length) {
        std::cerr << "GET " << m_bucket << "/" << m_key << " " << http_byte_range(offset, last) << " returned "
                  << body.size() << " bytes\n";
        ec = disk_errc::short_read;
        return false;
    }

    std::memcpy(buffer, body.data(), length);
    return true;
}
