#include "proxykeeper/service/ThresholdScheduler.hpp"

#include "proxykeeper/util/Logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <string>

namespace proxykeeper::service {

ThresholdScheduler::ThresholdScheduler(boost::asio::io_context& io,
                                       boost::asio::thread_pool& worker,
                                       proxy::RefillController& refill,
                                       proxy::ProxyStore& store,
                                       proxy::ValidationCache& cache,
                                       std::size_t minThreshold,
                                       std::chrono::milliseconds interval)
    : worker_(worker)
    , refill_(refill)
    , store_(store)
    , cache_(cache)
    , minThreshold_(minThreshold)
    , interval_(interval)
    , timer_(io) {}

void ThresholdScheduler::start() {
    if (stopped_.load() || started_.exchange(true)) {
        return;
    }
    arm();
}

void ThresholdScheduler::stop() {
    stopped_.store(true);
    std::scoped_lock lock(timerMutex_);
    timer_.cancel();
}

bool ThresholdScheduler::trigger() {
    if (stopped_.load()) {
        return false;
    }
    const auto size = store_.size();
    if (size > minThreshold_ || refill_.isRefilling() || queued_.exchange(true)) {
        return false;
    }

    util::log(util::LogLevel::info,
              "Available proxies (" + std::to_string(size) + ") at or below threshold (" +
                  std::to_string(minThreshold_) + "), refilling");
    boost::asio::post(worker_, [this]() {
        refill_.refill();
        queued_.store(false);
    });
    return true;
}

void ThresholdScheduler::arm() {
    std::scoped_lock lock(timerMutex_);
    if (stopped_.load()) {
        return;
    }
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        onTick(ec);
    });
}

void ThresholdScheduler::onTick(const boost::system::error_code& ec) {
    if (stopped_.load()) {
        return;
    }

    if (ec) {
        util::log(util::LogLevel::warn, "Pool check timer failed: " + ec.message());
    } else {
        if (auto removed = cache_.sweepExpired(); removed > 0) {
            util::log(util::LogLevel::debug, "Swept " + std::to_string(removed) + " expired cache entries");
        }
        trigger();
    }
    arm();
}

} // namespace proxykeeper::service
