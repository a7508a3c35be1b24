#pragma once

#include <stdexcept>
#include <string>

#include <boost/beast/http/status.hpp>

// recognized announce we cannot safely rewrite, the request is forwarded as is
class MalformedAnnounce : public std::runtime_error {
public:
    explicit MalformedAnnounce(const std::string& what): std::runtime_error(what) {}
};

// tracker could not be reached or did not answer in time
class UpstreamUnavailable : public std::runtime_error {
public:
    UpstreamUnavailable(const std::string& what, boost::beast::http::status status = boost::beast::http::status::bad_gateway)
        : std::runtime_error(what), _status(status) {}

    boost::beast::http::status status() const { return _status; }

private:
    boost::beast::http::status _status;
};

class ConfigInvalid : public std::runtime_error {
public:
    explicit ConfigInvalid(const std::string& what): std::runtime_error(what) {}
};
