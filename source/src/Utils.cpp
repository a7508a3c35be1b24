#include "Utils.hpp"

#include <charconv>

std::string to_hex(std::string_view bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out; out.resize(bytes.size() * 2);

    for (size_t i = 0; i < bytes.size(); ++i) {
        unsigned char b = static_cast<unsigned char>(bytes[i]);
        out[2*i]     = hex[(b >> 4) & 0xF];
        out[2*i + 1] = hex[b & 0xF];
    }

    return out;
}

// strict decimal, no sign, no whitespace, no overflow
std::optional<uint64_t> parse_u64(std::string_view digits) {
    if (digits.empty()) return std::nullopt;

    uint64_t value{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);

    if (ec != std::errc{} || ptr != digits.data() + digits.size()) return std::nullopt;
    return value;
}

double bytes_to_mb(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

std::string shorten(std::string_view text, size_t max_len) {
    if (text.size() <= max_len) return std::string(text);
    return std::string(text.substr(0, max_len)) + "...";
}
