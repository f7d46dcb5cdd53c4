#include "proxykeeper/service/ProgressReporter.hpp"

#include <algorithm>
#include <ostream>
#include <string_view>

namespace proxykeeper::service {
namespace {

constexpr std::size_t kBarLength = 15;

std::string repeat(std::string_view unit, std::size_t count) {
    std::string out;
    out.reserve(unit.size() * count);
    for (std::size_t i = 0; i < count; ++i) {
        out.append(unit);
    }
    return out;
}

} // namespace

std::string renderProgressBar(const std::string& message, std::size_t current, std::size_t total) {
    current = std::min(current, total);
    const std::size_t percent = total > 0 ? current * 100 / total : 0;
    const std::size_t done = kBarLength * percent / 100;

    std::string bar = "[" + repeat("-", done) + ">" + repeat("\xC2\xB7", kBarLength - done) + "]";
    return message + " " + bar + " " + std::to_string(current) + "/" + std::to_string(total) + " (" +
           std::to_string(percent) + "%)";
}

ProgressReporter::ProgressReporter(std::ostream& out, std::string message)
    : out_(out)
    , message_(std::move(message)) {}

void ProgressReporter::operator()(const proxy::RefillProgress& progress) {
    auto line = renderProgressBar(message_, progress.poolSize, progress.target);

    std::scoped_lock lock(mutex_);
    if (line == last_) {
        return;
    }
    if (!last_.empty()) {
        out_ << '\r';
    }
    out_ << line;
    if (progress.target > 0 && progress.poolSize >= progress.target) {
        out_ << '\n';
        last_.clear();
    } else {
        last_ = std::move(line);
    }
    out_.flush();
}

} // namespace proxykeeper::service
