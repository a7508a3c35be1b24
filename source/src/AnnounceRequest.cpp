#include "AnnounceRequest.hpp"
#include "ProxyErrors.hpp"
#include "Utils.hpp"

#include <boost/url.hpp>

namespace {

struct Field {
    std::string_view raw;
    size_t offset{};
    int count{};
};

struct AnnounceFields {
    Field info_hash, downloaded, uploaded, left;

    // value must be a view into target, so offsets are byte exact
    void note(std::string_view key, std::string_view value, std::string_view target) {
        Field* field = nullptr;

        if (key == "info_hash") field = &info_hash;
        else if (key == "uploaded") field = &uploaded;
        else if (key == "downloaded") field = &downloaded;
        else if (key == "left") field = &left;

        if (!field) return;

        ++field->count;
        if (field->count > 1) return;

        field->raw = value;
        field->offset = value.empty() ? 0 : static_cast<size_t>(value.data() - target.data());
    }
};

// Beast accepts targets RFC 3986 does not ('|', '{', raw UTF-8 ...), trackers take them anyway
bool split_raw_query(std::string_view target, AnnounceFields& fields) {
    auto start = target.find('?');
    if (start == std::string_view::npos) return false;

    auto query = target.substr(start + 1);
    query = query.substr(0, query.find('#'));

    while (true) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);

        auto eq = pair.find('=');
        auto key = pair.substr(0, eq);
        auto value = eq == std::string_view::npos ? pair.substr(pair.size()) : pair.substr(eq + 1);

        fields.note(key, value, target);

        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }

    return true;
}

} // namespace

std::optional<AnnounceRequest> recognize_announce(boost::beast::http::verb method, std::string_view target) {
    if (method != boost::beast::http::verb::get) return std::nullopt;

    AnnounceFields fields;

    if (auto rv = boost::urls::parse_uri_reference(target)) {
        if (!rv->has_query()) return std::nullopt;

        for (auto param: rv->encoded_params()) {
            fields.note(
                std::string_view(param.key.data(), param.key.size()),
                std::string_view(param.value.data(), param.value.size()),
                target);
        }
    }
    else if (!split_raw_query(target, fields)) {
        return std::nullopt;
    }

    const auto& [info_hash, downloaded, uploaded, left] = fields;

    // minimal tracker signature
    if (info_hash.count == 0 || uploaded.count == 0) return std::nullopt;

    if (info_hash.count > 1) throw MalformedAnnounce("duplicate info_hash parameter");

    auto encoded_hash = boost::urls::make_pct_string_view(info_hash.raw);
    if (!encoded_hash) throw MalformedAnnounce("info_hash is not valid percent-encoding");

    auto decoded_view = **encoded_hash;
    std::string decoded_hash(decoded_view.begin(), decoded_view.end());
    if (decoded_hash.empty()) throw MalformedAnnounce("empty info_hash parameter");

    if (uploaded.count > 1) throw MalformedAnnounce("duplicate uploaded parameter");
    auto uploaded_value = parse_u64(uploaded.raw);
    if (!uploaded_value) throw MalformedAnnounce("uploaded is not a decimal integer: " + std::string(uploaded.raw));

    if (downloaded.count != 1) throw MalformedAnnounce(downloaded.count == 0 ? "missing downloaded parameter" : "duplicate downloaded parameter");
    auto downloaded_value = parse_u64(downloaded.raw);
    if (!downloaded_value) throw MalformedAnnounce("downloaded is not a decimal integer: " + std::string(downloaded.raw));

    AnnounceRequest out;
    out.info_hash = to_hex(decoded_hash);
    out.downloaded = *downloaded_value;
    out.uploaded = *uploaded_value;
    out.uploaded_span = { uploaded.offset, uploaded.raw.size() };

    // unknown left never counts as completion
    if (left.count == 1) out.left = parse_u64(left.raw);

    return out;
}
