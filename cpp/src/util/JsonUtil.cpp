#include "proxykeeper/util/JsonUtil.hpp"

#include <charconv>
#include <fstream>
#include <iterator>

namespace proxykeeper::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        return std::nullopt;
    }
    return parseJson(content);
}

std::optional<std::string> stringField(const boost::json::object& obj, std::string_view key) {
    if (auto it = obj.if_contains(key); it && it->is_string()) {
        return std::string(it->as_string());
    }
    return std::nullopt;
}

std::optional<std::uint64_t> unsignedField(const boost::json::object& obj, std::string_view key) {
    auto it = obj.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (it->is_int64()) {
        auto value = it->as_int64();
        if (value < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(value);
    }
    if (it->is_uint64()) {
        return it->as_uint64();
    }
    if (it->is_string()) {
        const auto& str = it->as_string();
        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
        if (ec == std::errc{} && ptr == str.data() + str.size()) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<bool> boolField(const boost::json::object& obj, std::string_view key) {
    if (auto it = obj.if_contains(key); it && it->is_bool()) {
        return it->as_bool();
    }
    return std::nullopt;
}

} // namespace proxykeeper::util
