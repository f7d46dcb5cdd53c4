#include "proxykeeper/proxy/ProxyValidator.hpp"

#include "proxykeeper/util/HttpClient.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <algorithm>

namespace proxykeeper::proxy {
namespace {

constexpr char kDesktopUA[] =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36";

} // namespace

bool classifyProbeResponse(unsigned int status,
                           std::string_view body,
                           const std::vector<std::string>& markers) {
    if (status != 200) {
        return false;
    }
    return std::any_of(markers.begin(), markers.end(), [body](const std::string& marker) {
        return !marker.empty() && body.find(marker) != std::string_view::npos;
    });
}

ProxyValidator::ProxyValidator(util::HttpClient& httpClient, ProbeConfig config)
    : httpClient_(httpClient)
    , config_(std::move(config)) {}

bool ProxyValidator::validate(const Candidate& candidate) const {
    std::vector<util::HttpClient::Header> headers{
        {"User-Agent", kDesktopUA},
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.5"},
        {"Connection", "keep-alive"},
        {"Upgrade-Insecure-Requests", "1"}
    };

    util::HttpClient::Options options;
    options.connectTimeout = config_.connectTimeout;
    options.timeout = config_.requestTimeout;
    options.followRedirects = true;
    options.maxRedirects = config_.maxRedirects;
    options.proxy = util::ProxyRoute{candidate.host, candidate.port, candidate.username, candidate.password};

    try {
        auto response = httpClient_.get(config_.url, headers, options);
        const auto status = response.result_int();
        const bool valid = classifyProbeResponse(status, response.body(), config_.markers);
        util::log(util::LogLevel::debug,
                  "Proxy " + candidate.toString() + (valid ? " passed" : " failed") +
                      " probe, status " + std::to_string(status));
        return valid;
    } catch (const util::ProxyError& ex) {
        const char* reason = ex.type() == util::ProxyError::Type::authentication_required
                                 ? "rejected our credentials"
                                 : "refused the tunnel";
        util::log(util::LogLevel::debug,
                  "Proxy " + candidate.toString() + " " + reason + " (status " + std::to_string(ex.status()) + ")");
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug,
                  "Proxy " + candidate.toString() + " probe error: " + ex.what());
    }
    return false;
}

} // namespace proxykeeper::proxy
