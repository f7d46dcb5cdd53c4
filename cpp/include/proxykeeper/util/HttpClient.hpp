#pragma once

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace proxykeeper::util {

class ProxyError : public std::runtime_error {
public:
    enum class Type {
        connect_failed,
        authentication_required,
    };

    ProxyError(Type type, int status, const std::string& message)
        : std::runtime_error(message)
        , type_(type)
        , status_(status) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

    [[nodiscard]] int status() const noexcept { return status_; }

private:
    Type type_;
    int status_;
};

// Forward proxy a request is routed through.
struct ProxyRoute {
    std::string host;
    std::uint16_t port{};
    std::string username;
    std::string password;
};

// Blocking HTTP/1.1 GET client. Each call runs on its own io_context, so one instance
// can be shared by concurrent callers.
class HttpClient {
public:
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    struct Header {
        std::string name;
        std::string value;
    };

    struct Options {
        // Bounds name resolution and the TCP connect of every hop.
        std::chrono::milliseconds connectTimeout{std::chrono::seconds{5}};
        // Overall budget of one get(), redirects included.
        std::chrono::milliseconds timeout{std::chrono::seconds{10}};
        bool followRedirects{false};
        unsigned int maxRedirects{10};
        std::optional<ProxyRoute> proxy;
    };

    HttpClient();

    // Throws on transport failure and when the budget runs out. Any status code is
    // returned as a response.
    HttpResponse get(const std::string& url, const std::vector<Header>& headers, const Options& options);

private:
    boost::asio::ssl::context sslContext_;
};

} // namespace proxykeeper::util
