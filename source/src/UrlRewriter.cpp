#include "UrlRewriter.hpp"
#include "ProxyErrors.hpp"
#include "Utils.hpp"

std::string rewrite_uploaded(std::string_view target, const ValueSpan& span, uint64_t uploaded) {
    static constexpr std::string_view key = "uploaded=";

    if (span.offset < key.size() || span.offset + span.length > target.size())
        throw MalformedAnnounce("uploaded span outside of request target");

    if (target.substr(span.offset - key.size(), key.size()) != key)
        throw MalformedAnnounce("uploaded span does not follow uploaded=");

    char sep = span.offset == key.size() ? '\0' : target[span.offset - key.size() - 1];
    if (sep != '?' && sep != '&')
        throw MalformedAnnounce("uploaded span is not a query parameter");

    if (!parse_u64(target.substr(span.offset, span.length)))
        throw MalformedAnnounce("uploaded value is not a decimal integer");

    std::string out;
    out.reserve(target.size() + 20);

    out.append(target.substr(0, span.offset));
    out.append(std::to_string(uploaded));
    out.append(target.substr(span.offset + span.length));

    return out;
}
