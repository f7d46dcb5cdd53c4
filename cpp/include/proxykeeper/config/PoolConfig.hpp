#pragma once

#include "proxykeeper/proxy/ProviderClient.hpp"
#include "proxykeeper/proxy/ProxyValidator.hpp"
#include "proxykeeper/proxy/RefillController.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <boost/json/fwd.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace proxykeeper::config {

struct PoolConfig {
    std::size_t targetCount{20};
    unsigned int batchSize{20};
    std::chrono::milliseconds validationTimeout{5000};
    std::chrono::milliseconds requestTimeout{10000};
    std::string probeUrl{"https://www.notion.so"};
    std::vector<std::string> probeMarkers{"notion", "Notion"};
    unsigned int concurrency{10};
    std::size_t minThreshold{5};
    std::chrono::milliseconds checkInterval{30000};
    std::string protocol{"http"};
    unsigned int maxRefillAttempts{20};
    std::chrono::milliseconds retryDelay{1000};
    bool useCache{true};
    std::chrono::milliseconds cacheExpiry{3600000};
    unsigned int overFetchFactor{2};
    proxy::Country country{proxy::Country::us};
    std::string providerEndpoint{"https://proxy.doudouzi.me"};
    unsigned int providerMaxPerRequest{10};
    std::chrono::milliseconds providerTimeout{10000};
    util::LogLevel logLevel{util::LogLevel::info};
    bool showProgress{false};
};

// Defaults, then the JSON file (if present), then PROXYKEEPER_* environment variables.
PoolConfig loadPoolConfig(const std::filesystem::path& path);

void applyJson(PoolConfig& config, const boost::json::object& json);
void applyEnvironment(PoolConfig& config);

proxy::RefillSettings refillSettingsFrom(const PoolConfig& config);
proxy::ProbeConfig probeConfigFrom(const PoolConfig& config);
proxy::ProviderConfig providerConfigFrom(const PoolConfig& config);

} // namespace proxykeeper::config
