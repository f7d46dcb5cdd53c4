#pragma once

#include "proxykeeper/config/PoolConfig.hpp"
#include "proxykeeper/proxy/ProviderClient.hpp"
#include "proxykeeper/proxy/ProxyStore.hpp"
#include "proxykeeper/proxy/ProxyValidator.hpp"
#include "proxykeeper/proxy/RefillController.hpp"
#include "proxykeeper/proxy/ValidationCache.hpp"
#include "proxykeeper/service/ThresholdScheduler.hpp"
#include "proxykeeper/util/HttpClient.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace proxykeeper::service {

// Owns the pool, its validation cache and the refill machinery. The scheduler timer runs
// on the supplied io_context; refills triggered after initialize() run on a private worker.
class PoolManager {
public:
    PoolManager(boost::asio::io_context& io, config::PoolConfig config);
    // Replaces the upstream provider and the probe, mainly for tests.
    PoolManager(boost::asio::io_context& io,
                config::PoolConfig config,
                proxy::CandidateFetcher fetcher,
                proxy::CandidateValidator validator);
    ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    // Runs the first refill on the calling thread, then starts periodic checks.
    // Later or concurrent calls return RefillStatus::skipped without waiting.
    proxy::RefillOutcome initialize();

    std::optional<proxy::ValidatedProxy> acquire();
    bool remove(std::string_view host, std::uint16_t port);
    std::vector<proxy::ValidatedProxy> snapshot() const;
    std::size_t size() const;

    void setCountry(proxy::Country country);
    void setObserver(proxy::RefillObserver observer);
    void stop();

    bool initialized() const;
    bool isRefilling() const { return refill_.isRefilling(); }
    const config::PoolConfig& config() const { return config_; }

private:
    config::PoolConfig config_;
    util::HttpClient httpClient_;
    proxy::ProxyStore store_;
    proxy::ValidationCache cache_;
    std::optional<proxy::ProviderClient> provider_;
    std::optional<proxy::ProxyValidator> validator_;
    proxy::RefillController refill_;
    boost::asio::thread_pool worker_{1};
    ThresholdScheduler scheduler_;
    std::atomic<bool> initializing_{false};
    std::atomic<bool> initialized_{false};
};

} // namespace proxykeeper::service
