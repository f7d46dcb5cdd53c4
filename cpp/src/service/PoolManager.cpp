#include "proxykeeper/service/PoolManager.hpp"

#include "proxykeeper/service/ProgressReporter.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace proxykeeper::service {
namespace {

proxy::RefillObserver progressObserver() {
    auto reporter = std::make_shared<ProgressReporter>(std::clog, "Refill progress");
    return [reporter](const proxy::RefillProgress& progress) { (*reporter)(progress); };
}

} // namespace

PoolManager::PoolManager(boost::asio::io_context& io, config::PoolConfig config)
    : config_(std::move(config))
    , cache_(config_.cacheExpiry)
    , provider_(std::in_place, httpClient_, config::providerConfigFrom(config_))
    , validator_(std::in_place, httpClient_, config::probeConfigFrom(config_))
    , refill_(config::refillSettingsFrom(config_),
              store_,
              cache_,
              [this](const proxy::BatchRequest& request) { return provider_->fetch(request); },
              [this](const proxy::Candidate& candidate) { return validator_->validate(candidate); })
    , scheduler_(io, worker_, refill_, store_, cache_, config_.minThreshold, config_.checkInterval) {
    refill_.setCountry(config_.country);
    if (config_.showProgress) {
        refill_.setObserver(progressObserver());
    }
}

PoolManager::PoolManager(boost::asio::io_context& io,
                         config::PoolConfig config,
                         proxy::CandidateFetcher fetcher,
                         proxy::CandidateValidator validator)
    : config_(std::move(config))
    , cache_(config_.cacheExpiry)
    , refill_(config::refillSettingsFrom(config_), store_, cache_, std::move(fetcher), std::move(validator))
    , scheduler_(io, worker_, refill_, store_, cache_, config_.minThreshold, config_.checkInterval) {
    refill_.setCountry(config_.country);
    if (config_.showProgress) {
        refill_.setObserver(progressObserver());
    }
}

PoolManager::~PoolManager() {
    scheduler_.stop();
    worker_.join();
}

proxy::RefillOutcome PoolManager::initialize() {
    if (initializing_.exchange(true)) {
        proxy::RefillOutcome outcome;
        outcome.poolSize = store_.size();
        return outcome;
    }

    util::log(util::LogLevel::info,
              "Initializing proxy pool, target " + std::to_string(config_.targetCount) + " proxies from " +
                  proxy::toString(refill_.country()));
    auto outcome = refill_.refill();
    scheduler_.start();
    initialized_.store(true);
    util::log(util::LogLevel::info,
              "Proxy pool initialized, available proxies: " + std::to_string(store_.size()));
    return outcome;
}

std::optional<proxy::ValidatedProxy> PoolManager::acquire() {
    auto proxy = store_.acquire();
    if (!proxy) {
        util::log(util::LogLevel::warn, "No proxy available");
    }
    return proxy;
}

bool PoolManager::remove(std::string_view host, std::uint16_t port) {
    auto removed = store_.remove(host, port);
    const auto address = std::string(host) + ":" + std::to_string(port);
    if (removed) {
        if (config_.useCache) {
            cache_.put(removed->identity(), false);
        }
        util::log(util::LogLevel::debug,
                  "Removed proxy " + address + ", available proxies: " + std::to_string(store_.size()));
    } else {
        util::log(util::LogLevel::debug, "Proxy " + address + " is not in the pool");
    }

    scheduler_.trigger();
    return removed.has_value();
}

std::vector<proxy::ValidatedProxy> PoolManager::snapshot() const {
    return store_.snapshot();
}

std::size_t PoolManager::size() const {
    return store_.size();
}

void PoolManager::setCountry(proxy::Country country) {
    refill_.setCountry(country);
    util::log(util::LogLevel::info, "Proxy country set to " + proxy::toString(country));
}

void PoolManager::setObserver(proxy::RefillObserver observer) {
    refill_.setObserver(std::move(observer));
}

void PoolManager::stop() {
    scheduler_.stop();
    util::log(util::LogLevel::info, "Proxy pool service stopped");
}

bool PoolManager::initialized() const {
    return initialized_.load();
}

} // namespace proxykeeper::service
