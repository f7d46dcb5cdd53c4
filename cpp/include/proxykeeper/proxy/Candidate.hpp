#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace proxykeeper::proxy {

// Two proxies are the same proxy when all four fields match. Removal requests only
// carry host and port, see matchesAddress().
struct ProxyIdentity {
    std::string host;
    std::uint16_t port{};
    std::string username;
    std::string password;

    bool operator==(const ProxyIdentity&) const = default;

    bool matchesAddress(std::string_view otherHost, std::uint16_t otherPort) const {
        return host == otherHost && port == otherPort;
    }
};

struct ProxyIdentityHash {
    std::size_t operator()(const ProxyIdentity& identity) const noexcept;
};

struct Candidate {
    std::string host;
    std::uint16_t port{};
    std::string username;
    std::string password;

    bool hasCredentials() const { return !username.empty() || !password.empty(); }
    ProxyIdentity identity() const { return {host, port, username, password}; }

    // host:port or host:port:user:pass
    std::string toString() const;
};

Candidate candidateFrom(const ProxyIdentity& identity);

// host:port[:user:pass]; anything without a usable host and port is dropped.
std::optional<Candidate> parseCandidate(std::string_view text);

// One provider JSON record, e.g. {"ip":"1.2.3.4","port":"8080"}.
std::optional<Candidate> parseProviderRecord(std::string_view line);

} // namespace proxykeeper::proxy
