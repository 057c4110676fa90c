#include "format.hpp"

#include <cctype>
#include <cstdio>
#include <limits>
#include <sstream>

std::string format_hex_line(std::uint64_t offset, const std::uint8_t* bytes, std::size_t count) {
    if (count > HEX_BYTES_PER_LINE) {
        count = HEX_BYTES_PER_LINE;
    }

    char address[24];
    std::snprintf(address, sizeof(address), "%016llx", static_cast<unsigned long long>(offset));

    std::string line{address};
    line += "  ";

    std::string ascii;
    for (std::size_t i = 0; i < HEX_BYTES_PER_LINE; ++i) {
        if (i < count) {
            char byte[4];
            std::snprintf(byte, sizeof(byte), "%02x ", bytes[i]);
            line += byte;
            ascii += std::isprint(bytes[i]) ? static_cast<char>(bytes[i]) : '.';
        } else {
            line += "   ";
        }
    }

    line += " |" + ascii + "|";
    return line;
}

std::optional<std::uint64_t> parse_size(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::string digits = text;
    std::uint64_t multiplier = 1;
    switch (std::toupper(static_cast<unsigned char>(digits.back()))) {
    case 'K':
        multiplier = 1ull << 10;
        break;
    case 'M':
        multiplier = 1ull << 20;
        break;
    case 'G':
        multiplier = 1ull << 30;
        break;
    default:
        break;
    }
    if (multiplier != 1) {
        digits.pop_back();
    }

    int base = 10;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        base = 16;
        digits = digits.substr(2);
    }
    if (digits.empty()) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    for (char c : digits) {
        int digit{};
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digit = c - '0';
        } else if (base == 16 && std::isxdigit(static_cast<unsigned char>(c))) {
            digit = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        } else {
            return std::nullopt;
        }
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / base) {
            return std::nullopt;
        }
        value = value * base + digit;
    }

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

std::string format_size(std::uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream out;
    if (unit == 0) {
        out << bytes << " B";
    } else {
        out.precision(1);
        out << std::fixed << value << " " << units[unit];
    }
    return out.str();
}

char overlay_marker(const std::vector<Chunk>& chunks, std::uint64_t start, std::uint64_t end) {
    char marker = ' ';
    for (const auto& chunk : chunks) {
        if (chunk.start() > end) {
            break;
        }
        if (chunk.end() < start) {
            continue;
        }
        if (!chunk.is_discard()) {
            return 'M';
        }
        marker = 'D';
    }
    return marker;
}

std::string describe_chunk(const Chunk& chunk) {
    std::ostringstream out;
    out << "[" << chunk.start() << ", " << chunk.end() << "] "
        << (chunk.is_discard() ? "discard" : "data") << ", " << chunk.length() << " bytes";
    return out.str();
}
