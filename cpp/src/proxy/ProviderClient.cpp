#include "proxykeeper/proxy/ProviderClient.hpp"

#include "proxykeeper/util/HttpClient.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace proxykeeper::proxy {
namespace {

std::string urlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // namespace

std::optional<Country> parseCountry(std::string_view code) {
    std::string lower(code);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "us") return Country::us;
    if (lower == "uk") return Country::uk;
    if (lower == "jp") return Country::jp;
    if (lower == "de") return Country::de;
    if (lower == "fr") return Country::fr;
    if (lower == "ca") return Country::ca;
    return std::nullopt;
}

std::string toString(Country country) {
    switch (country) {
    case Country::us: return "us";
    case Country::uk: return "uk";
    case Country::jp: return "jp";
    case Country::de: return "de";
    case Country::fr: return "fr";
    case Country::ca: return "ca";
    }
    return "us";
}

std::string buildBatchUrl(const ProviderConfig& config, const BatchRequest& request) {
    std::string url = config.endpoint;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    const auto cap = std::max(1u, config.maxPerRequest);
    const auto count = std::clamp(request.count, 1u, cap);

    url += "/random/" + toString(request.country);
    url += "?number=" + std::to_string(count);
    url += "&protocol=" + urlEncode(request.protocol);
    url += "&type=json";
    return url;
}

std::vector<Candidate> parseBatchBody(std::string_view body) {
    std::vector<Candidate> candidates;
    std::size_t start = 0;
    while (start < body.size()) {
        auto pos = body.find('\n', start);
        auto length = (pos == std::string_view::npos) ? body.size() - start : pos - start;
        auto line = body.substr(start, length);
        start = (pos == std::string_view::npos) ? body.size() : pos + 1;

        if (auto candidate = parseProviderRecord(line)) {
            candidates.push_back(std::move(*candidate));
        }
    }
    return candidates;
}

ProviderClient::ProviderClient(util::HttpClient& httpClient, ProviderConfig config)
    : httpClient_(httpClient)
    , config_(std::move(config)) {}

std::vector<Candidate> ProviderClient::fetch(const BatchRequest& request) {
    const auto url = buildBatchUrl(config_, request);
    util::log(util::LogLevel::debug, "Fetching proxy batch: " + url);

    std::vector<util::HttpClient::Header> headers{
        {"User-Agent",
         "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/108.0.0.0 Safari/537.36"},
        {"Accept", "application/json, text/plain"}
    };

    util::HttpClient::Options options;
    options.connectTimeout = config_.timeout;
    options.timeout = config_.timeout;

    try {
        auto response = httpClient_.get(url, headers, options);
        const auto status = response.result_int();
        if (status < 200 || status >= 300) {
            util::log(util::LogLevel::warn,
                      "Proxy provider returned status " + std::to_string(status));
            return {};
        }

        auto candidates = parseBatchBody(response.body());
        if (candidates.empty()) {
            util::log(util::LogLevel::warn, "Proxy provider returned no usable records");
        } else {
            util::log(util::LogLevel::debug,
                      "Proxy provider returned " + std::to_string(candidates.size()) + " candidates");
        }
        return candidates;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"Proxy provider request failed: "} + ex.what());
    }
    return {};
}

} // namespace proxykeeper::proxy
