#include "proxykeeper/config/PoolConfig.hpp"

#include "proxykeeper/util/JsonUtil.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string_view>

namespace proxykeeper::config {
namespace {

std::optional<std::uint64_t> envUnsigned(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    auto parsed = std::strtoull(value, &end, 10);
    if (end == value || *end != '\0' || *value == '-') {
        return std::nullopt;
    }
    if (errno == ERANGE) {
        util::log(util::LogLevel::warn, std::string{"Ignoring out-of-range "} + name + "=" + value);
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(parsed);
}

std::optional<bool> envBool(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    return std::nullopt;
}

std::vector<std::string> splitMarkers(std::string_view text) {
    std::vector<std::string> markers;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto pos = text.find(',', start);
        auto token = text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
        if (!token.empty()) {
            markers.emplace_back(token);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return markers;
}

// Values the target type cannot hold are dropped instead of wrapping.
template <typename T>
bool fits(std::uint64_t value, std::string_view key) {
    if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        util::log(util::LogLevel::warn,
                  "Ignoring out-of-range " + std::string(key) + "=" + std::to_string(value));
        return false;
    }
    return true;
}

template <typename T>
void setValue(T& target, std::optional<std::uint64_t> value, std::string_view key) {
    if (value && fits<T>(*value, key)) {
        target = static_cast<T>(*value);
    }
}

void setMs(std::chrono::milliseconds& target, std::optional<std::uint64_t> value, std::string_view key) {
    if (value && fits<std::chrono::milliseconds::rep>(*value, key)) {
        target = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*value));
    }
}

// Zero means "keep the default" for counts and timeouts.
template <typename T>
void setPositive(T& target, std::optional<std::uint64_t> value, std::string_view key) {
    if (value && *value > 0) {
        setValue(target, value, key);
    }
}

void setPositiveMs(std::chrono::milliseconds& target, std::optional<std::uint64_t> value, std::string_view key) {
    if (value && *value > 0) {
        setMs(target, value, key);
    }
}

} // namespace

void applyJson(PoolConfig& config, const boost::json::object& json) {
    setPositive(config.targetCount, util::unsignedField(json, "targetCount"), "targetCount");
    setPositive(config.batchSize, util::unsignedField(json, "batchSize"), "batchSize");
    setPositiveMs(config.validationTimeout, util::unsignedField(json, "validationTimeoutMs"), "validationTimeoutMs");
    setPositiveMs(config.requestTimeout, util::unsignedField(json, "requestTimeoutMs"), "requestTimeoutMs");
    if (auto url = util::stringField(json, "probeUrl"); url && !url->empty()) {
        config.probeUrl = *url;
    }
    if (auto it = json.if_contains("probeMarkers")) {
        std::vector<std::string> markers;
        if (it->is_string()) {
            markers = splitMarkers(std::string_view(it->as_string()));
        } else if (it->is_array()) {
            for (const auto& item : it->as_array()) {
                if (item.is_string() && !item.as_string().empty()) {
                    markers.emplace_back(item.as_string());
                }
            }
        }
        if (!markers.empty()) {
            config.probeMarkers = std::move(markers);
        }
    }
    setPositive(config.concurrency, util::unsignedField(json, "concurrency"), "concurrency");
    setValue(config.minThreshold, util::unsignedField(json, "minThreshold"), "minThreshold");
    setPositiveMs(config.checkInterval, util::unsignedField(json, "checkIntervalMs"), "checkIntervalMs");
    if (auto protocol = util::stringField(json, "protocol"); protocol && !protocol->empty()) {
        config.protocol = *protocol;
    }
    setPositive(config.maxRefillAttempts, util::unsignedField(json, "maxRefillAttempts"), "maxRefillAttempts");
    setMs(config.retryDelay, util::unsignedField(json, "retryDelayMs"), "retryDelayMs");
    if (auto useCache = util::boolField(json, "useCache")) {
        config.useCache = *useCache;
    }
    setPositiveMs(config.cacheExpiry, util::unsignedField(json, "cacheExpiryMs"), "cacheExpiryMs");
    setPositive(config.overFetchFactor, util::unsignedField(json, "overFetchFactor"), "overFetchFactor");
    if (auto country = util::stringField(json, "country")) {
        if (auto parsed = proxy::parseCountry(*country)) {
            config.country = *parsed;
        } else {
            util::log(util::LogLevel::warn, "Unsupported proxy country '" + *country + "', keeping " +
                                                proxy::toString(config.country));
        }
    }
    if (auto endpoint = util::stringField(json, "providerEndpoint"); endpoint && !endpoint->empty()) {
        config.providerEndpoint = *endpoint;
    }
    setPositive(config.providerMaxPerRequest, util::unsignedField(json, "providerMaxPerRequest"), "providerMaxPerRequest");
    setPositiveMs(config.providerTimeout, util::unsignedField(json, "providerTimeoutMs"), "providerTimeoutMs");
    if (auto level = util::stringField(json, "logLevel")) {
        if (auto parsed = util::parseLogLevel(*level)) {
            config.logLevel = *parsed;
        }
    }
    if (auto showProgress = util::boolField(json, "showProgress")) {
        config.showProgress = *showProgress;
    }
}

void applyEnvironment(PoolConfig& config) {
    setPositive(config.targetCount, envUnsigned("PROXYKEEPER_TARGET_COUNT"), "PROXYKEEPER_TARGET_COUNT");
    setPositive(config.batchSize, envUnsigned("PROXYKEEPER_BATCH_SIZE"), "PROXYKEEPER_BATCH_SIZE");
    setPositiveMs(config.validationTimeout, envUnsigned("PROXYKEEPER_VALIDATION_TIMEOUT_MS"), "PROXYKEEPER_VALIDATION_TIMEOUT_MS");
    setPositiveMs(config.requestTimeout, envUnsigned("PROXYKEEPER_REQUEST_TIMEOUT_MS"), "PROXYKEEPER_REQUEST_TIMEOUT_MS");
    if (const char* value = std::getenv("PROXYKEEPER_PROBE_URL"); value && *value) {
        config.probeUrl = value;
    }
    if (const char* value = std::getenv("PROXYKEEPER_PROBE_MARKERS")) {
        if (auto markers = splitMarkers(value); !markers.empty()) {
            config.probeMarkers = std::move(markers);
        }
    }
    setPositive(config.concurrency, envUnsigned("PROXYKEEPER_CONCURRENCY"), "PROXYKEEPER_CONCURRENCY");
    setValue(config.minThreshold, envUnsigned("PROXYKEEPER_MIN_THRESHOLD"), "PROXYKEEPER_MIN_THRESHOLD");
    setPositiveMs(config.checkInterval, envUnsigned("PROXYKEEPER_CHECK_INTERVAL_MS"), "PROXYKEEPER_CHECK_INTERVAL_MS");
    if (const char* value = std::getenv("PROXYKEEPER_PROTOCOL"); value && *value) {
        config.protocol = value;
    }
    setPositive(config.maxRefillAttempts, envUnsigned("PROXYKEEPER_MAX_REFILL_ATTEMPTS"), "PROXYKEEPER_MAX_REFILL_ATTEMPTS");
    setMs(config.retryDelay, envUnsigned("PROXYKEEPER_RETRY_DELAY_MS"), "PROXYKEEPER_RETRY_DELAY_MS");
    if (auto useCache = envBool("PROXYKEEPER_USE_CACHE")) {
        config.useCache = *useCache;
    }
    setPositiveMs(config.cacheExpiry, envUnsigned("PROXYKEEPER_CACHE_EXPIRY_MS"), "PROXYKEEPER_CACHE_EXPIRY_MS");
    setPositive(config.overFetchFactor, envUnsigned("PROXYKEEPER_OVER_FETCH_FACTOR"), "PROXYKEEPER_OVER_FETCH_FACTOR");
    if (const char* value = std::getenv("PROXYKEEPER_COUNTRY")) {
        if (auto parsed = proxy::parseCountry(value)) {
            config.country = *parsed;
        } else {
            util::log(util::LogLevel::warn, std::string{"Ignoring unsupported PROXYKEEPER_COUNTRY="} + value);
        }
    }
    if (const char* value = std::getenv("PROXYKEEPER_PROVIDER_ENDPOINT"); value && *value) {
        config.providerEndpoint = value;
    }
    setPositiveMs(config.providerTimeout, envUnsigned("PROXYKEEPER_PROVIDER_TIMEOUT_MS"), "PROXYKEEPER_PROVIDER_TIMEOUT_MS");
    if (const char* value = std::getenv("PROXYKEEPER_LOG_LEVEL")) {
        if (auto parsed = util::parseLogLevel(value)) {
            config.logLevel = *parsed;
        }
    }
    if (auto showProgress = envBool("PROXYKEEPER_SHOW_PROGRESS")) {
        config.showProgress = *showProgress;
    }
}

PoolConfig loadPoolConfig(const std::filesystem::path& path) {
    PoolConfig config;
    try {
        if (auto json = util::readJsonFile(path)) {
            if (json->is_object()) {
                applyJson(config, json->as_object());
            } else {
                util::log(util::LogLevel::warn, "Proxy pool config " + path.string() + " is not a JSON object");
            }
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"Failed to parse proxy pool config: "} + ex.what());
    }
    applyEnvironment(config);
    return config;
}

proxy::RefillSettings refillSettingsFrom(const PoolConfig& config) {
    proxy::RefillSettings settings;
    settings.targetCount = config.targetCount;
    settings.batchSize = config.batchSize;
    settings.overFetchFactor = std::max(1u, config.overFetchFactor);
    settings.providerMaxPerRequest = config.providerMaxPerRequest;
    settings.maxAttempts = config.maxRefillAttempts;
    settings.retryDelay = config.retryDelay;
    settings.concurrency = std::max(1u, config.concurrency);
    settings.useCache = config.useCache;
    settings.protocol = config.protocol;
    return settings;
}

proxy::ProbeConfig probeConfigFrom(const PoolConfig& config) {
    proxy::ProbeConfig probe;
    probe.url = config.probeUrl;
    probe.markers = config.probeMarkers;
    probe.connectTimeout = config.validationTimeout;
    probe.requestTimeout = config.requestTimeout;
    return probe;
}

proxy::ProviderConfig providerConfigFrom(const PoolConfig& config) {
    proxy::ProviderConfig provider;
    provider.endpoint = config.providerEndpoint;
    provider.maxPerRequest = config.providerMaxPerRequest;
    provider.timeout = config.providerTimeout;
    return provider;
}

} // namespace proxykeeper::config
