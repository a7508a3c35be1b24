#pragma once

#include <string>
#include <string_view>
#include <optional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

// one best-effort look at a release feed, failures only show up in debug logs
class UpdateChecker {
public:
    UpdateChecker(boost::asio::any_io_executor exec, std::string feed_url, std::string current_version);

    [[nodiscard]] boost::asio::awaitable<void> check();

    // tag_name of a release object, e.g. {"tag_name": "v0.9.1", ...}
    static std::optional<std::string> parse_latest_version(std::string_view body);

    // dotted numeric compare, a leading v is ignored
    static bool is_newer(std::string_view candidate, std::string_view current);

private:
    [[nodiscard]] boost::asio::awaitable<std::string> fetch();

    boost::asio::any_io_executor _exec;
    boost::asio::ssl::context _ssl_ctx;
    std::string _feed_url;
    std::string _current_version;
};
