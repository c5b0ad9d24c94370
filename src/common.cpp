#include "rangegate/common.hpp"
#include <sstream>
#include <iomanip>
#include <limits>
#include <cctype>

namespace rangegate {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

} // anonymous namespace

std::string bytes_to_hex(const byte* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string bytes_to_hex(const bytes& data) {
    return bytes_to_hex(data.data(), data.size());
}

bool hex_to_bytes(const std::string& hex, byte* out, size_t out_len) {
    if (hex.length() != out_len * 2) return false;

    for (size_t i = 0; i < out_len; ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out[i] = static_cast<byte>((hi << 4) | lo);
    }
    return true;
}

std::string url_encode(const std::string& value) {
    static const char digits[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(value.size() * 3);
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            result += ch;
        } else {
            result += '%';
            result += digits[c >> 4];
            result += digits[c & 0x0f];
        }
    }
    return result;
}

std::optional<std::string> url_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%') {
            if (i + 2 >= value.size()) {
                return std::nullopt;
            }
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            result += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else if (c == '+') {
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

std::optional<uint64_t> parse_u64(const std::string& text) {
    if (text.empty() || text.size() > 20) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::string format_size(uint64_t size) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};

    if (size < 1024) {
        return std::to_string(size) + " B";
    }

    double value = static_cast<double>(size);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

} // namespace rangegate
