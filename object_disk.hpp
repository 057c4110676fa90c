#ifndef OBJECT_DISK_H
#define OBJECT_DISK_H

#include "disk.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

// Connection to an object store (S3 or compatible), supplied by the caller.
class ObjectStorageClient {
public:
    virtual ~ObjectStorageClient() = default;

    virtual bool head_object(const std::string& bucket, const std::string& key, std::uint64_t& content_length,
                             std::error_code& ec) = 0;

    // Fetches bytes [first, last] of the object into body.
    virtual bool get_object_range(const std::string& bucket, const std::string& key, std::uint64_t first,
                                  std::uint64_t last, std::vector<std::uint8_t>& body, std::error_code& ec) = 0;
};

// "bytes=first-last", the HTTP Range header value for an inclusive range.
std::string http_byte_range(std::uint64_t first, std::uint64_t last);

// Read-only disk over one object. Writes are kept in memory.
class ObjectDisk : public Disk {
public:
    ObjectDisk(std::shared_ptr<ObjectStorageClient> client, std::string bucket, std::string key,
               bool record_reads = false, bool discard_is_zero = true);

    const std::string& bucket() const { return m_bucket; };
    const std::string& key() const { return m_key; };

protected:
    bool do_get_capacity(std::uint64_t& capacity, std::error_code& ec) override;
    bool do_read(std::uint8_t* buffer, std::size_t length, std::uint64_t offset, std::error_code& ec) override;

private:
    std::shared_ptr<ObjectStorageClient> m_client;
    const std::string m_bucket;
    const std::string m_key;
};

#endif
