#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace proxykeeper::util {

boost::json::value parseJson(const std::string& payload);

// Reads a whole file and parses it; nullopt when the file is absent or empty.
std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path);

std::optional<std::string> stringField(const boost::json::object& obj, std::string_view key);
// Accepts integer values and numeric strings; negative values yield nullopt.
std::optional<std::uint64_t> unsignedField(const boost::json::object& obj, std::string_view key);
std::optional<bool> boolField(const boost::json::object& obj, std::string_view key);

} // namespace proxykeeper::util
