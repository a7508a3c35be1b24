#pragma once

#include <string>
#include <string_view>
#include <chrono>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

struct UpstreamTarget {
    std::string host;           // for the resolver, no brackets
    std::string port;
    std::string host_header;    // host[:port] as the client wrote it
    std::string origin_form;    // path and query, bytes untouched
};

// absolute URI (proxy form) or origin form plus Host header
// throws std::invalid_argument when no http upstream can be derived
UpstreamTarget parse_upstream_target(std::string_view target, std::string_view host_header);

// one fresh upstream connection per request, response bytes are relayed verbatim
class Forwarder {
public:
    explicit Forwarder(std::chrono::seconds timeout): _timeout(timeout) {}

    // throws UpstreamUnavailable when nothing reached the client yet
    // returns quietly when the client goes away, the upstream socket is closed on the way out
    [[nodiscard]] net::awaitable<void> async_forward(tcp::socket& client, http::request<http::string_body> req, const UpstreamTarget& upstream);

private:
    [[nodiscard]] net::awaitable<boost::system::error_code> connect_and_send(tcp::socket& upstream, http::request<http::string_body>& req, const UpstreamTarget& target);
    [[nodiscard]] net::awaitable<boost::system::error_code> relay_response(tcp::socket& upstream, tcp::socket& client, size_t& relayed);
    [[nodiscard]] net::awaitable<void> watch_client(tcp::socket& client);
    [[nodiscard]] net::awaitable<void> expire(net::steady_timer& timer);

    std::chrono::seconds _timeout;
};
