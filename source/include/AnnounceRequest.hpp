#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

#include <boost/beast/http/verb.hpp>

// position of a parameter value inside the raw request target
struct ValueSpan {
    size_t offset{}, length{};
};

struct AnnounceRequest {
    std::string info_hash;              // lowercase hex of the percent-decoded hash
    uint64_t downloaded{};
    uint64_t uploaded{};                // client's own figure, informational only
    std::optional<uint64_t> left;       // nullopt when absent or unparseable
    ValueSpan uploaded_span;
};

// returns nullopt for anything that is not a tracker announce (pass-through traffic)
// throws MalformedAnnounce when it looks like an announce but cannot be rewritten safely
std::optional<AnnounceRequest> recognize_announce(boost::beast::http::verb method, std::string_view target);
