#include "Forwarder.hpp"
#include "ProxyErrors.hpp"
#include "Logging.hpp"

#include <stdexcept>
#include <array>

#include <boost/url.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

using namespace boost::asio::experimental::awaitable_operators;

namespace {

std::string resolver_host(const boost::urls::authority_view& auth) {
    if (auth.host_type() == boost::urls::host_type::ipv6) return auth.host_ipv6_address().to_string();
    return std::string(auth.encoded_host());
}

UpstreamTarget from_authority(std::string_view authority, std::string_view what) {
    auto auth = boost::urls::parse_authority(authority);
    if (!auth || auth->encoded_host().empty()) throw std::invalid_argument("invalid " + std::string(what));

    UpstreamTarget out;
    out.host = resolver_host(*auth);
    out.port = auth->has_port() ? std::string(auth->port()) : "80";
    out.host_header = std::string(auth->encoded_host_and_port());

    return out;
}

} // namespace

// only the authority is parsed, path and query are passed on as raw bytes whatever they contain
UpstreamTarget parse_upstream_target(std::string_view target, std::string_view host_header) {
    if (!target.empty() && target.front() == '/') {
        if (host_header.empty()) throw std::invalid_argument("origin-form request without Host header");

        auto out = from_authority(host_header, "Host header");
        out.host_header = std::string(host_header);
        out.origin_form = std::string(target);
        return out;
    }

    auto scheme_end = target.find("://");
    if (scheme_end == std::string_view::npos) throw std::invalid_argument("invalid request target");

    auto scheme = target.substr(0, scheme_end);
    if (!boost::urls::grammar::ci_is_equal(scheme, std::string_view("http")))
        throw std::invalid_argument("unsupported scheme: " + std::string(scheme));

    auto rest = target.substr(scheme_end + 3);
    auto authority_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authority_end);

    if (authority.empty()) throw std::invalid_argument("request target has no host");

    auto out = from_authority(authority, "request target authority");

    // slice, never re-encode
    auto origin = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);
    origin = origin.substr(0, origin.find('#'));

    out.origin_form = std::string(origin);
    if (out.origin_form.empty() || out.origin_form.front() != '/') out.origin_form.insert(0, "/");

    return out;
}

net::awaitable<void> Forwarder::async_forward(tcp::socket& client, http::request<http::string_body> req, const UpstreamTarget& upstream_target) {
    auto executor = co_await net::this_coro::executor;
    auto logger = proxy_logger();

    tcp::socket upstream(executor);
    net::steady_timer deadline(executor);

    req.target(upstream_target.origin_form);
    if (req.find(http::field::host) == req.end()) req.set(http::field::host, upstream_target.host_header);

    // hop-by-hop, and one exchange per upstream connection so the tracker ends the response by closing
    req.erase("Proxy-Connection");
    req.set(http::field::connection, "close");

    deadline.expires_after(_timeout);
    auto sent = co_await (connect_and_send(upstream, req, upstream_target) || watch_client(client) || expire(deadline));

    if (sent.index() == 1) {
        logger->debug("client left before {} answered", upstream_target.host_header);
        co_return;
    }

    if (sent.index() == 2)
        throw UpstreamUnavailable("timed out connecting to " + upstream_target.host_header, http::status::gateway_timeout);

    if (auto ec = std::get<0>(sent))
        throw UpstreamUnavailable(upstream_target.host_header + ": " + ec.message());

    size_t relayed = 0;

    deadline.expires_after(_timeout);
    auto done = co_await (relay_response(upstream, client, relayed) || watch_client(client) || expire(deadline));

    boost::system::error_code ignored;
    upstream.shutdown(tcp::socket::shutdown_both, ignored);
    upstream.close(ignored);

    switch (done.index()) {
        case 0:
            if (auto ec = std::get<0>(done); ec && relayed == 0)
                throw UpstreamUnavailable(upstream_target.host_header + ": " + ec.message());
            break;

        case 1:
            logger->debug("client closed while relaying from {}", upstream_target.host_header);
            break;

        case 2:
            // a partial response cannot be replaced by an error page any more
            if (relayed == 0)
                throw UpstreamUnavailable("timed out waiting for " + upstream_target.host_header, http::status::gateway_timeout);
            logger->warn("response from {} cut off after {} bytes", upstream_target.host_header, relayed);
            break;
    }
}

net::awaitable<boost::system::error_code> Forwarder::connect_and_send(tcp::socket& upstream, http::request<http::string_body>& req, const UpstreamTarget& target) {
    auto executor = co_await net::this_coro::executor;
    boost::system::error_code ec;

    tcp::resolver resolver(executor);

    auto results = co_await resolver.async_resolve(target.host, target.port, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return ec;

    co_await net::async_connect(upstream, results, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return ec;

    co_await http::async_write(upstream, req, net::redirect_error(net::use_awaitable, ec));
    co_return ec;
}

net::awaitable<boost::system::error_code> Forwarder::relay_response(tcp::socket& upstream, tcp::socket& client, size_t& relayed) {
    std::array<char, 8192> buf{};

    for (;;) {
        boost::system::error_code read_ec, write_ec;
        auto n = co_await upstream.async_read_some(net::buffer(buf), net::redirect_error(net::use_awaitable, read_ec));

        if (n > 0) {
            co_await net::async_write(client, net::buffer(buf.data(), n), net::redirect_error(net::use_awaitable, write_ec));
            if (write_ec) co_return write_ec;
            relayed += n;
        }

        // tracker closing the connection is the normal end of the response
        if (read_ec == net::error::eof) co_return boost::system::error_code{};
        if (read_ec) co_return read_ec;
    }
}

// finishes when the client hangs up, anything it sends meanwhile is dropped
net::awaitable<void> Forwarder::watch_client(tcp::socket& client) {
    std::array<char, 512> buf{};
    boost::system::error_code ec;

    while (!ec) {
        co_await client.async_read_some(net::buffer(buf), net::redirect_error(net::use_awaitable, ec));
    }
}

net::awaitable<void> Forwarder::expire(net::steady_timer& timer) {
    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
}
