#include "UpdateChecker.hpp"
#include "Logging.hpp"

#include <vector>
#include <charconv>
#include <algorithm>
#include <stdexcept>

#include <boost/beast.hpp>
#include <boost/json.hpp>
#include <boost/url.hpp>

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

std::vector<unsigned long> version_parts(std::string_view v) {
    if (!v.empty() && (v.front() == 'v' || v.front() == 'V')) v.remove_prefix(1);

    std::vector<unsigned long> parts;

    while (!v.empty()) {
        unsigned long n{};
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
        if (ec != std::errc{}) break;

        parts.push_back(n);
        v.remove_prefix(static_cast<size_t>(ptr - v.data()));

        // stop at suffixes like -rc1
        if (v.empty() || v.front() != '.') break;
        v.remove_prefix(1);
    }

    return parts;
}

} // namespace

UpdateChecker::UpdateChecker(boost::asio::any_io_executor exec, std::string feed_url, std::string current_version):
    _exec(exec),
    _ssl_ctx(ssl::context::tlsv12_client),
    _feed_url(std::move(feed_url)),
    _current_version(std::move(current_version))
    {
        _ssl_ctx.set_default_verify_paths();
        _ssl_ctx.set_verify_mode(ssl::verify_peer);
    }

boost::asio::awaitable<void> UpdateChecker::check() {
    auto logger = proxy_logger();

    try {
        auto body = co_await fetch();
        auto latest = parse_latest_version(body);

        if (!latest) {
            logger->debug("update check: no tag_name in release feed");
            co_return;
        }

        if (is_newer(*latest, _current_version))
            logger->info("a newer version is available: {} (running {})", *latest, _current_version);
        else
            logger->debug("update check: {} is up to date", _current_version);
    }
    catch (const std::exception& ex) {
        logger->debug("update check failed: {}", ex.what());
    }
}

boost::asio::awaitable<std::string> UpdateChecker::fetch() {
    auto rv = boost::urls::parse_uri(_feed_url);
    if (!rv) throw std::runtime_error("invalid update feed URL");
    if (rv->scheme_id() != boost::urls::scheme::https) throw std::runtime_error("update feed must use https");

    std::string host = std::string(rv->encoded_host());
    std::string port = rv->has_port() ? std::string(rv->port()) : "443";
    std::string target = std::string(rv->encoded_target());
    if (target.empty()) target = "/";

    boost::system::error_code ec;
    tcp::resolver resolver(_exec);
    ssl::stream<tcp::socket> stream(_exec, _ssl_ctx);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
        throw std::runtime_error("could not set SNI host name");

    auto results = co_await resolver.async_resolve(host, port, net::redirect_error(net::use_awaitable, ec));
    if (ec) throw boost::system::system_error(ec);

    co_await net::async_connect(stream.next_layer(), results, net::redirect_error(net::use_awaitable, ec));
    if (ec) throw boost::system::system_error(ec);

    co_await stream.async_handshake(ssl::stream_base::client, net::redirect_error(net::use_awaitable, ec));
    if (ec) throw boost::system::system_error(ec);

    http::request<http::string_body> req{ http::verb::get, target, 11 };
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "greedy-proxy/" + _current_version);
    req.set(http::field::accept, "application/json");

    co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, ec));
    if (ec) throw boost::system::system_error(ec);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;

    co_await http::async_read(stream, buffer, res, net::redirect_error(net::use_awaitable, ec));
    if (ec) throw boost::system::system_error(ec);

    // servers often drop the connection without close_notify, the body is already complete
    co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));

    if (res.result() != http::status::ok)
        throw std::runtime_error("release feed answered " + std::to_string(res.result_int()));

    co_return res.body();
}

std::optional<std::string> UpdateChecker::parse_latest_version(std::string_view body) {
    boost::system::error_code ec;
    auto value = boost::json::parse(body, ec);

    if (ec || !value.is_object()) return std::nullopt;

    auto* tag = value.as_object().if_contains("tag_name");
    if (!tag || !tag->is_string()) return std::nullopt;

    const auto& tag_name = tag->as_string();
    return std::string(tag_name.data(), tag_name.size());
}

bool UpdateChecker::is_newer(std::string_view candidate, std::string_view current) {
    auto a = version_parts(candidate);
    auto b = version_parts(current);

    if (a.empty()) return false;

    a.resize(std::max(a.size(), b.size()));
    b.resize(a.size());

    return a > b;
}
