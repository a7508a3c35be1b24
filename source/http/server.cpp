#include "server.hpp"
#include "ProxyConfig.hpp"
#include "ProxyErrors.hpp"
#include "AnnounceRequest.hpp"
#include "AnnounceProcessor.hpp"
#include "UrlRewriter.hpp"
#include "Logging.hpp"
#include "Utils.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast.hpp>

using tcp = boost::asio::ip::tcp;
using namespace boost::asio;

namespace http = boost::beast::http;
namespace net = boost::asio;

ProxyServer::ProxyServer(boost::asio::io_context& ioc, const ProxyConfig& cfg, AnnounceProcessor& processor)
    : _ioc(ioc),
      _address(cfg.listen_address),
      _port(cfg.listen_port),
      _processor(processor),
      _forwarder(std::chrono::seconds(cfg.upstream_timeout_seconds)) {}

// -------------------- announce handling --------------------

awaitable<std::string> ProxyServer::apply_announce_policy(http::verb method, std::string target) {
    auto logger = proxy_logger();
    std::optional<AnnounceRequest> announce;

    // fail open, a single unmodified announce is better than a broken tracker exchange
    try {
        announce = recognize_announce(method, target);
    }
    catch (const MalformedAnnounce& ex) {
        logger->warn("malformed announce, forwarding unmodified: {}", ex.what());
    }

    if (!announce) {
        logger->debug("pass-through {}", shorten(target, 120));
        co_return target;
    }

    auto decision = co_await _processor.async_process(*announce);

    std::string rewritten;

    try {
        rewritten = rewrite_uploaded(target, announce->uploaded_span, decision.fake_uploaded);
    }
    catch (const MalformedAnnounce& ex) {
        logger->warn("could not rewrite announce for {}, forwarding unmodified: {}", announce->info_hash, ex.what());
        rewritten = target;
    }

    co_return rewritten;
}

// -------------------- async accept loop --------------------

awaitable<void> ProxyServer::accept_loop() {
    auto logger = proxy_logger();

    while (_acceptor && _acceptor->is_open()) {
        boost::system::error_code ec;

        // every connection runs on its own strand
        tcp::socket socket = co_await _acceptor->async_accept(net::make_strand(_ioc), redirect_error(use_awaitable, ec));

        if (ec == net::error::operation_aborted) co_return;

        if (ec) {
            logger->warn("accept failed: {}", ec.message());
            continue;
        }

        auto exec = socket.get_executor();
        co_spawn(exec, handle_connection(std::move(socket)), detached);
    }
}

awaitable<void> ProxyServer::handle_connection(tcp::socket socket) {
    auto logger = proxy_logger();

    try {
        boost::beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(REQUEST_BODY_LIMIT);

        boost::system::error_code ec;
        co_await http::async_read(socket, buffer, parser, redirect_error(use_awaitable, ec));

        if (ec) {
            if (ec != http::error::end_of_stream) logger->debug("bad request from client: {}", ec.message());
            co_return;
        }

        auto req = parser.release();

        if (req.method() == http::verb::connect) {
            co_await send_error(socket, http::status::method_not_allowed, req.version(), "CONNECT tunnelling is not supported");
            co_return;
        }

        auto raw_target = req.target();
        auto target = co_await apply_announce_policy(req.method(), std::string(raw_target.data(), raw_target.size()));

        auto host = req[http::field::host];
        UpstreamTarget upstream;

        try {
            upstream = parse_upstream_target(target, std::string_view(host.data(), host.size()));
        }
        catch (const std::invalid_argument& ex) {
            logger->warn("cannot forward {}: {}", shorten(target, 120), ex.what());
            ec = http::error::bad_target;
        }

        if (ec) {
            co_await send_error(socket, http::status::bad_request, req.version(), "cannot determine upstream tracker");
            co_return;
        }

        std::optional<UpstreamUnavailable> failure;
        auto version = req.version();

        try {
            co_await _forwarder.async_forward(socket, std::move(req), upstream);
        }
        catch (const UpstreamUnavailable& ex) {
            logger->error("tracker unreachable: {}", ex.what());
            failure = ex;
        }

        if (failure) co_await send_error(socket, failure->status(), version, failure->what());

        socket.shutdown(tcp::socket::shutdown_both, ec);
    }
    catch (const std::exception& e) {
        logger->error("connection error: {}", e.what());
    }
}

awaitable<void> ProxyServer::send_error(tcp::socket& socket, http::status status, unsigned version, std::string_view message) {
    http::response<http::string_body> res{ status, version };
    res.set(http::field::server, "greedy-proxy");
    res.set(http::field::content_type, "text/plain");
    res.set(http::field::connection, "close");
    res.body() = std::string(message);
    res.prepare_payload();

    boost::system::error_code ec;
    co_await http::async_write(socket, res, redirect_error(use_awaitable, ec));

    socket.shutdown(tcp::socket::shutdown_both, ec);
}

// -------------------- entry point --------------------

void ProxyServer::run() {
    auto endpoint = tcp::endpoint(net::ip::make_address(_address), _port);

    _acceptor = std::make_unique<tcp::acceptor>(_ioc);
    _acceptor->open(endpoint.protocol());
    _acceptor->set_option(tcp::acceptor::reuse_address(true));
    _acceptor->bind(endpoint);
    _acceptor->listen(net::socket_base::max_listen_connections);

    proxy_logger()->info("listening on {}:{}", _address, port());

    co_spawn(_ioc, accept_loop(), detached);
}

void ProxyServer::stop() {
    boost::system::error_code ec;
    if (_acceptor) _acceptor->close(ec);
}

unsigned short ProxyServer::port() const {
    return _acceptor ? _acceptor->local_endpoint().port() : _port;
}
