#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

std::string to_hex(std::string_view bytes);
std::optional<uint64_t> parse_u64(std::string_view digits);
double bytes_to_mb(uint64_t bytes);
std::string shorten(std::string_view text, size_t max_len);
