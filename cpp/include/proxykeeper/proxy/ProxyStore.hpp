#pragma once

#include "proxykeeper/proxy/Candidate.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace proxykeeper::proxy {

struct ValidatedProxy {
    std::string host;
    std::uint16_t port{};
    std::string protocol{"http"};
    std::string username;
    std::string password;
    std::string uri;
    std::chrono::system_clock::time_point addedAt{};

    ProxyIdentity identity() const { return {host, port, username, password}; }
    bool hasCredentials() const { return !username.empty() || !password.empty(); }
};

ValidatedProxy makeValidatedProxy(const Candidate& candidate,
                                  const std::string& protocol,
                                  std::chrono::system_clock::time_point addedAt = std::chrono::system_clock::now());

class ProxyStore {
public:
    ProxyStore() = default;

    std::optional<ValidatedProxy> acquire();
    bool insertIfAbsent(ValidatedProxy proxy);
    bool contains(const ProxyIdentity& identity) const;
    // Credentials are not part of the removal key.
    std::optional<ValidatedProxy> remove(std::string_view host, std::uint16_t port);

    std::size_t size() const;
    std::vector<ValidatedProxy> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::vector<ValidatedProxy> pool_;
    std::size_t cursor_{};
};

} // namespace proxykeeper::proxy
