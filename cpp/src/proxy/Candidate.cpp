#include "proxykeeper/proxy/Candidate.hpp"

#include "proxykeeper/util/JsonUtil.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <boost/json.hpp>

#include <charconv>
#include <functional>
#include <vector>

namespace proxykeeper::proxy {
namespace {

std::string_view trimView(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

std::optional<std::uint16_t> parsePort(std::string_view text) {
    text = trimView(text);
    if (text.empty()) {
        return std::nullopt;
    }
    unsigned long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    if (value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

void hashCombine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace

std::size_t ProxyIdentityHash::operator()(const ProxyIdentity& identity) const noexcept {
    std::size_t seed = std::hash<std::string>{}(identity.host);
    hashCombine(seed, std::hash<std::uint16_t>{}(identity.port));
    hashCombine(seed, std::hash<std::string>{}(identity.username));
    hashCombine(seed, std::hash<std::string>{}(identity.password));
    return seed;
}

std::string Candidate::toString() const {
    std::string text = host + ":" + std::to_string(port);
    if (hasCredentials()) {
        text += ":" + username + ":" + password;
    }
    return text;
}

Candidate candidateFrom(const ProxyIdentity& identity) {
    return Candidate{identity.host, identity.port, identity.username, identity.password};
}

std::optional<Candidate> parseCandidate(std::string_view text) {
    auto trimmed = trimView(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (start <= trimmed.size()) {
        auto pos = trimmed.find(':', start);
        if (pos == std::string_view::npos) {
            fields.push_back(trimmed.substr(start));
            break;
        }
        fields.push_back(trimmed.substr(start, pos - start));
        start = pos + 1;
    }

    if (fields.size() < 2) {
        return std::nullopt;
    }
    auto host = trimView(fields[0]);
    auto port = parsePort(fields[1]);
    if (host.empty() || !port) {
        return std::nullopt;
    }

    Candidate candidate;
    candidate.host = std::string(host);
    candidate.port = *port;
    if (fields.size() >= 4) {
        candidate.username = std::string(fields[2]);
        candidate.password = std::string(fields[3]);
    }
    return candidate;
}

std::optional<Candidate> parseProviderRecord(std::string_view line) {
    auto trimmed = trimView(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    boost::json::value json;
    try {
        json = util::parseJson(std::string(trimmed));
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug,
                  "Skipping unparseable provider record: " + std::string(ex.what()));
        return std::nullopt;
    }
    if (!json.is_object()) {
        return std::nullopt;
    }
    const auto& obj = json.as_object();

    auto host = util::stringField(obj, "ip");
    if (!host || host->empty()) {
        return std::nullopt;
    }

    std::optional<std::uint16_t> port;
    if (auto text = util::stringField(obj, "port")) {
        port = parsePort(*text);
    } else if (auto number = util::unsignedField(obj, "port"); number && *number > 0 && *number <= 65535) {
        port = static_cast<std::uint16_t>(*number);
    }
    if (!port) {
        return std::nullopt;
    }

    Candidate candidate;
    candidate.host = *host;
    candidate.port = *port;
    auto username = util::stringField(obj, "username");
    auto password = util::stringField(obj, "password");
    if (username && password && !username->empty() && !password->empty()) {
        candidate.username = *username;
        candidate.password = *password;
    }
    return candidate;
}

} // namespace proxykeeper::proxy
