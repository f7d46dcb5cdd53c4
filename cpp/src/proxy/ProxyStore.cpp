#include "proxykeeper/proxy/ProxyStore.hpp"

#include <algorithm>

namespace proxykeeper::proxy {
namespace {

bool sameProxy(const ValidatedProxy& lhs, const ProxyIdentity& rhs) {
    return lhs.host == rhs.host && lhs.port == rhs.port && lhs.username == rhs.username && lhs.password == rhs.password;
}

std::string composeUri(const Candidate& candidate, const std::string& protocol) {
    std::string uri = protocol + "://";
    if (candidate.hasCredentials()) {
        uri += candidate.username + ":" + candidate.password + "@";
    }
    uri += candidate.host + ":" + std::to_string(candidate.port);
    return uri;
}

} // namespace

ValidatedProxy makeValidatedProxy(const Candidate& candidate,
                                  const std::string& protocol,
                                  std::chrono::system_clock::time_point addedAt) {
    ValidatedProxy proxy;
    proxy.host = candidate.host;
    proxy.port = candidate.port;
    proxy.protocol = protocol;
    proxy.username = candidate.username;
    proxy.password = candidate.password;
    proxy.uri = composeUri(candidate, protocol);
    proxy.addedAt = addedAt;
    return proxy;
}

std::optional<ValidatedProxy> ProxyStore::acquire() {
    std::scoped_lock lock(mutex_);
    if (pool_.empty()) {
        return std::nullopt;
    }
    if (cursor_ >= pool_.size()) {
        cursor_ = 0;
    }
    ValidatedProxy proxy = pool_[cursor_];
    cursor_ = (cursor_ + 1) % pool_.size();
    return proxy;
}

bool ProxyStore::insertIfAbsent(ValidatedProxy proxy) {
    const auto identity = proxy.identity();
    std::scoped_lock lock(mutex_);
    auto match = std::find_if(pool_.begin(), pool_.end(),
                              [&](const ValidatedProxy& entry) { return sameProxy(entry, identity); });
    if (match != pool_.end()) {
        return false;
    }
    pool_.push_back(std::move(proxy));
    return true;
}

bool ProxyStore::contains(const ProxyIdentity& identity) const {
    std::scoped_lock lock(mutex_);
    return std::any_of(pool_.begin(), pool_.end(),
                       [&](const ValidatedProxy& entry) { return sameProxy(entry, identity); });
}

std::optional<ValidatedProxy> ProxyStore::remove(std::string_view host, std::uint16_t port) {
    std::scoped_lock lock(mutex_);
    auto match = std::find_if(pool_.begin(), pool_.end(), [&](const ValidatedProxy& entry) {
        return entry.identity().matchesAddress(host, port);
    });
    if (match == pool_.end()) {
        return std::nullopt;
    }

    const auto index = static_cast<std::size_t>(std::distance(pool_.begin(), match));
    ValidatedProxy removed = std::move(*match);
    pool_.erase(match);

    // Keep the cursor on the entry that would have been handed out next.
    if (index < cursor_) {
        --cursor_;
    }
    if (cursor_ >= pool_.size()) {
        cursor_ = 0;
    }
    return removed;
}

std::size_t ProxyStore::size() const {
    std::scoped_lock lock(mutex_);
    return pool_.size();
}

std::vector<ValidatedProxy> ProxyStore::snapshot() const {
    std::scoped_lock lock(mutex_);
    return pool_;
}

} // namespace proxykeeper::proxy
