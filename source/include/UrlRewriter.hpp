#pragma once

#include <string>
#include <string_view>
#include <cstdint>

#include "AnnounceRequest.hpp"

// replaces only the digits of the uploaded value, every other byte of target is kept
// throws MalformedAnnounce if span does not cover an uploaded= value
std::string rewrite_uploaded(std::string_view target, const ValueSpan& span, uint64_t uploaded);
