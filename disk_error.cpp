#include "disk_error.hpp"

#include <string>

namespace {

class DiskErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "overlaydisk"; }

    std::string message(int value) const override {
        switch (static_cast<disk_errc>(value)) {
        case disk_errc::backend_io:
            return "backend I/O error";
        case disk_errc::capacity_unavailable:
            return "disk capacity unavailable";
        case disk_errc::short_read:
            return "backend returned fewer bytes than requested";
        case disk_errc::not_supported:
            return "operation not supported by this backend";
        case disk_errc::not_open:
            return "disk is not open";
        case disk_errc::invalid_argument:
            return "invalid argument";
        }
        return "unknown disk error";
    }
};

}

const std::error_category& disk_category() noexcept {
    static const DiskErrorCategory category{};
    return category;
}

std::error_code make_error_code(disk_errc e) noexcept {
    return {static_cast<int>(e), disk_category()};
}
