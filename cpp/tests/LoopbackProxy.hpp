#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace proxykeeper::testsupport {

// Single-threaded HTTP listener on 127.0.0.1 that plays a forward proxy: it records
// every request it receives and answers with whatever the reply callback builds.
class LoopbackProxy {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Reply = std::function<Response(const Request&)>;

    struct Seen {
        std::string method;
        std::string target;
        std::string host;
        std::string proxyAuthorization;
    };

    explicit LoopbackProxy(Reply reply)
        : acceptor_(io_, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0))
        , reply_(std::move(reply)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackProxy() {
        stopping_.store(true);
        // Unblocks the pending accept().
        boost::system::error_code ec;
        boost::asio::ip::tcp::socket wake(io_);
        wake.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), port_), ec);
        thread_.join();
    }

    LoopbackProxy(const LoopbackProxy&) = delete;
    LoopbackProxy& operator=(const LoopbackProxy&) = delete;

    std::uint16_t port() const { return port_; }

    std::vector<Seen> seen() const {
        std::scoped_lock lock(mutex_);
        return seen_;
    }

    static Response respond(boost::beast::http::status status, std::string body = {}) {
        Response response{status, 11};
        response.body() = std::move(body);
        return response;
    }

private:
    void serve() {
        namespace http = boost::beast::http;
        while (!stopping_.load()) {
            boost::asio::ip::tcp::socket socket(io_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping_.load()) {
                break;
            }

            boost::beast::flat_buffer buffer;
            Request request;
            http::read(socket, buffer, request, ec);
            if (ec) {
                continue;
            }
            {
                std::scoped_lock lock(mutex_);
                seen_.push_back({std::string(request.method_string()),
                                 std::string(request.target()),
                                 std::string(request[http::field::host]),
                                 std::string(request[http::field::proxy_authorization])});
            }

            auto response = reply_(request);
            response.keep_alive(false);
            response.prepare_payload();
            http::write(socket, response, ec);
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        }
    }

    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Reply reply_;
    std::uint16_t port_{};
    std::atomic<bool> stopping_{false};
    mutable std::mutex mutex_;
    std::vector<Seen> seen_;
    std::thread thread_;
};

} // namespace proxykeeper::testsupport
