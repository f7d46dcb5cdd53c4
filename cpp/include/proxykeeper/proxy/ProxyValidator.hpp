#pragma once

#include "proxykeeper/proxy/Candidate.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace proxykeeper::util {
class HttpClient;
}

namespace proxykeeper::proxy {

struct ProbeConfig {
    std::string url{"https://www.notion.so"};
    std::vector<std::string> markers{"notion", "Notion"};
    std::chrono::milliseconds connectTimeout{std::chrono::seconds{5}};
    std::chrono::milliseconds requestTimeout{std::chrono::seconds{10}};
    unsigned int maxRedirects{10};
};

// Status must be exactly 200 and the body must contain at least one marker.
bool classifyProbeResponse(unsigned int status,
                           std::string_view body,
                           const std::vector<std::string>& markers);

class ProxyValidator {
public:
    ProxyValidator(util::HttpClient& httpClient, ProbeConfig config);

    // Routes one GET through the candidate. Errors and timeouts count as invalid.
    bool validate(const Candidate& candidate) const;

    const ProbeConfig& config() const { return config_; }

private:
    util::HttpClient& httpClient_;
    ProbeConfig config_;
};

} // namespace proxykeeper::proxy
