#include "proxykeeper/util/HttpClient.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <utility>

namespace proxykeeper::util {
namespace {
constexpr unsigned kHttpVersion = 11;

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
    }
    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find_first_of("/?", hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    auto colonPos = hostPort.find(':');
    if (colonPos == std::string::npos) {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    } else {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    if (parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    return parsed;
}

bool isRedirect(http::status status) {
    switch (status) {
    case http::status::moved_permanently:
    case http::status::found:
    case http::status::see_other:
    case http::status::temporary_redirect:
    case http::status::permanent_redirect:
        return true;
    default:
        return false;
    }
}

std::string combineLocation(const ParsedUrl& base, const std::string& location) {
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }
    if (location.rfind("//", 0) == 0) {
        return base.scheme + ":" + location;
    }
    std::string prefix = base.scheme + "://" + base.host;
    if (!base.port.empty() && base.port != "80" && base.port != "443") {
        prefix += ":" + base.port;
    }
    if (location.front() == '/') {
        return prefix + location;
    }
    auto slashPos = base.target.find_last_of('/');
    std::string basePath = slashPos == std::string::npos ? "/" : base.target.substr(0, slashPos + 1);
    return prefix + basePath + location;
}

std::string base64Encode(std::string_view input) {
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::uint32_t value = 0;
    int bitCount = -6;
    for (unsigned char c : input) {
        value = (value << 8) | c;
        bitCount += 8;
        while (bitCount >= 0) {
            output.push_back(alphabet[(value >> bitCount) & 0x3F]);
            bitCount -= 6;
        }
    }

    if (bitCount > -6) {
        output.push_back(alphabet[((value << 8) >> (bitCount + 8)) & 0x3F]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

std::string proxyAuthorization(const ProxyRoute& proxy) {
    if (proxy.username.empty() && proxy.password.empty()) {
        return {};
    }
    return "Basic " + base64Encode(proxy.username + ":" + proxy.password);
}

std::string authorityFrom(const ParsedUrl& parsed) {
    if ((parsed.scheme == "http" && parsed.port == "80") ||
        (parsed.scheme == "https" && parsed.port == "443")) {
        return parsed.host;
    }
    return parsed.host + ":" + parsed.port;
}

using Clock = std::chrono::steady_clock;
using Request = http::request<http::empty_body>;

// Expiry for the next operation: at most limit from now and never past the deadline.
Clock::time_point boundedBy(Clock::time_point deadline, std::chrono::milliseconds limit) {
    const auto now = Clock::now();
    if (now >= deadline) {
        throw boost::system::system_error(boost::beast::error::timeout);
    }
    return std::min(deadline, now + std::chrono::duration_cast<Clock::duration>(limit));
}

// Starts one async operation and drives the private io_context until it completes.
template <typename Initiate>
void runUntilComplete(boost::asio::io_context& io, Initiate&& initiate) {
    boost::system::error_code result = boost::asio::error::would_block;
    std::forward<Initiate>(initiate)([&result](const boost::system::error_code& ec, auto&&...) {
        result = ec;
    });
    io.restart();
    io.run();
    if (result) {
        throw boost::system::system_error(result);
    }
}

tcp::resolver::results_type resolve(boost::asio::io_context& io,
                                    const std::string& host,
                                    const std::string& port,
                                    Clock::time_point expiry) {
    tcp::resolver resolver(io);
    boost::asio::steady_timer deadline(io);
    tcp::resolver::results_type results;
    boost::system::error_code result = boost::asio::error::would_block;

    deadline.expires_at(expiry);
    deadline.async_wait([&resolver](const boost::system::error_code& ec) {
        if (!ec) {
            resolver.cancel();
        }
    });
    resolver.async_resolve(host, port,
                           [&](const boost::system::error_code& ec, tcp::resolver::results_type resolved) {
                               result = ec;
                               results = std::move(resolved);
                               deadline.cancel();
                           });
    io.restart();
    io.run();
    if (result) {
        throw boost::system::system_error(result);
    }
    return results;
}

template <typename Stream>
HttpClient::HttpResponse exchange(boost::asio::io_context& io,
                                  Stream& stream,
                                  Request& request,
                                  Clock::time_point expiry) {
    boost::beast::get_lowest_layer(stream).expires_at(expiry);
    runUntilComplete(io, [&](auto handler) { http::async_write(stream, request, std::move(handler)); });

    boost::beast::flat_buffer buffer;
    HttpClient::HttpResponse response;
    runUntilComplete(io, [&](auto handler) { http::async_read(stream, buffer, response, std::move(handler)); });
    return response;
}

void openTunnel(boost::asio::io_context& io,
                boost::beast::tcp_stream& stream,
                const ParsedUrl& target,
                const ProxyRoute& proxy,
                Clock::time_point expiry) {
    // CONNECT always names the port, default or not.
    const auto authority = target.host + ":" + target.port;
    Request connectRequest{http::verb::connect, authority, kHttpVersion};
    connectRequest.set(http::field::host, authority);
    if (auto auth = proxyAuthorization(proxy); !auth.empty()) {
        connectRequest.set(http::field::proxy_authorization, auth);
    }

    stream.expires_at(expiry);
    runUntilComplete(io, [&](auto handler) { http::async_write(stream, connectRequest, std::move(handler)); });

    // A CONNECT reply never carries a body; skip() stops the parser from waiting for one.
    boost::beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    runUntilComplete(io, [&](auto handler) { http::async_read(stream, buffer, parser, std::move(handler)); });

    const auto status = parser.get().result();
    if (status == http::status::proxy_authentication_required) {
        throw ProxyError(ProxyError::Type::authentication_required, 407, "Proxy authentication required");
    }
    if (status != http::status::ok) {
        const auto code = static_cast<int>(parser.get().result_int());
        throw ProxyError(ProxyError::Type::connect_failed, code,
                         "Proxy CONNECT failed with status " + std::to_string(code));
    }
}

HttpClient::HttpResponse roundTrip(boost::asio::ssl::context& sslContext,
                                   Request request,
                                   const ParsedUrl& target,
                                   const HttpClient::Options& options,
                                   Clock::time_point deadline) {
    boost::asio::io_context io;
    const ProxyRoute* proxy = options.proxy ? &*options.proxy : nullptr;

    const auto connectBy = boundedBy(deadline, options.connectTimeout);
    auto endpoints = proxy ? resolve(io, proxy->host, std::to_string(proxy->port), connectBy)
                           : resolve(io, target.host, target.port, connectBy);

    if (target.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(io, sslContext);
        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_at(connectBy);
        runUntilComplete(io, [&](auto handler) { lowest.async_connect(endpoints, std::move(handler)); });

        if (proxy) {
            openTunnel(io, lowest, target, *proxy, boundedBy(deadline, options.timeout));
        }

        if (!SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str())) {
            throw std::runtime_error("Failed to set SNI host name");
        }

        lowest.expires_at(boundedBy(deadline, options.timeout));
        runUntilComplete(io, [&](auto handler) {
            stream.async_handshake(boost::asio::ssl::stream_base::client, std::move(handler));
        });

        auto response = exchange(io, stream, request, boundedBy(deadline, options.timeout));

        // The response is complete; a failed close_notify does not invalidate it.
        lowest.expires_at(deadline);
        boost::system::error_code shutdownError;
        stream.async_shutdown([&shutdownError](const boost::system::error_code& ec) { shutdownError = ec; });
        io.restart();
        io.run();
        if (shutdownError && shutdownError != boost::asio::error::eof &&
            shutdownError != boost::asio::ssl::error::stream_truncated) {
            log(LogLevel::trace, "TLS shutdown with " + target.host + " failed: " + shutdownError.message());
        }
        return response;
    }

    boost::beast::tcp_stream stream(io);
    stream.expires_at(connectBy);
    runUntilComplete(io, [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });

    if (proxy) {
        request.target(target.scheme + "://" + authorityFrom(target) + target.target);
        if (auto auth = proxyAuthorization(*proxy); !auth.empty()) {
            request.set(http::field::proxy_authorization, auth);
        }
    }

    auto response = exchange(io, stream, request, boundedBy(deadline, options.timeout));

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        log(LogLevel::trace, "Socket shutdown with " + target.host + " failed: " + ec.message());
    }

    if (proxy && response.result() == http::status::proxy_authentication_required) {
        throw ProxyError(ProxyError::Type::authentication_required, 407, "Proxy authentication required");
    }
    return response;
}

} // namespace

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_none);
}

HttpClient::HttpResponse HttpClient::get(const std::string& url,
                                         const std::vector<Header>& headers,
                                         const Options& options) {
    const auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(options.timeout);
    std::string currentUrl = url;

    for (unsigned int redirect = 0; redirect <= options.maxRedirects; ++redirect) {
        ParsedUrl parsed = parseUrl(currentUrl);
        Request request{http::verb::get, parsed.target, kHttpVersion};
        request.set(http::field::host, authorityFrom(parsed));
        request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);

        for (const auto& header : headers) {
            request.set(header.name, header.value);
        }

        auto response = roundTrip(sslContext_, std::move(request), parsed, options, deadline);

        if (!options.followRedirects || !isRedirect(response.result())) {
            return response;
        }

        auto locationIt = response.base().find(http::field::location);
        if (locationIt == response.base().end() || locationIt->value().empty()) {
            return response;
        }

        currentUrl = combineLocation(parsed, std::string(locationIt->value()));
        log(LogLevel::trace, "Following redirect to " + currentUrl);
    }

    throw std::runtime_error("Maximum redirect count exceeded");
}

} // namespace proxykeeper::util
