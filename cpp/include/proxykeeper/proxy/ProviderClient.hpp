#pragma once

#include "proxykeeper/proxy/Candidate.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace proxykeeper::util {
class HttpClient;
}

namespace proxykeeper::proxy {

enum class Country {
    us,
    uk,
    jp,
    de,
    fr,
    ca
};

std::optional<Country> parseCountry(std::string_view code);
std::string toString(Country country);

struct ProviderConfig {
    std::string endpoint{"https://proxy.doudouzi.me"};
    unsigned int maxPerRequest{10};
    std::chrono::milliseconds timeout{std::chrono::seconds{10}};
};

struct BatchRequest {
    Country country{Country::us};
    std::string protocol{"http"};
    unsigned int count{};
};

// <endpoint>/random/<country>?number=<n>&protocol=<proto>&type=json, n capped at maxPerRequest.
std::string buildBatchUrl(const ProviderConfig& config, const BatchRequest& request);

// Newline-delimited JSON records; unusable lines are skipped.
std::vector<Candidate> parseBatchBody(std::string_view body);

class ProviderClient {
public:
    ProviderClient(util::HttpClient& httpClient, ProviderConfig config);

    // Failures are logged and produce an empty batch.
    std::vector<Candidate> fetch(const BatchRequest& request);

    const ProviderConfig& config() const { return config_; }

private:
    util::HttpClient& httpClient_;
    ProviderConfig config_;
};

} // namespace proxykeeper::proxy
