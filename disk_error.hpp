#ifndef DISK_ERROR_H
#define DISK_ERROR_H

#include <system_error>

enum class disk_errc {
    backend_io = 1,
    capacity_unavailable,
    short_read,
    not_supported,
    not_open,
    invalid_argument
};

const std::error_category& disk_category() noexcept;

std::error_code make_error_code(disk_errc e) noexcept;

namespace std {
template <>
struct is_error_code_enum<disk_errc> : true_type {};
}

#endif
