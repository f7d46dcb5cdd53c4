#pragma once

#include "proxykeeper/proxy/ProxyStore.hpp"
#include "proxykeeper/proxy/RefillController.hpp"
#include "proxykeeper/proxy/ValidationCache.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>

namespace proxykeeper::service {

class ThresholdScheduler {
public:
    ThresholdScheduler(boost::asio::io_context& io,
                       boost::asio::thread_pool& worker,
                       proxy::RefillController& refill,
                       proxy::ProxyStore& store,
                       proxy::ValidationCache& cache,
                       std::size_t minThreshold,
                       std::chrono::milliseconds interval);

    void start();
    void stop();

    // Posts a refill to the worker when the pool is at or below the threshold and no
    // cycle is running or queued. Returns whether one was posted.
    bool trigger();

    bool running() const { return started_.load() && !stopped_.load(); }

    // Timer completion. A failed wait is logged; either way the timer is re-armed unless
    // the scheduler has been stopped.
    void onTick(const boost::system::error_code& ec);

private:
    void arm();

    boost::asio::thread_pool& worker_;
    proxy::RefillController& refill_;
    proxy::ProxyStore& store_;
    proxy::ValidationCache& cache_;
    std::size_t minThreshold_;
    std::chrono::milliseconds interval_;
    std::mutex timerMutex_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> queued_{false};
};

} // namespace proxykeeper::service
