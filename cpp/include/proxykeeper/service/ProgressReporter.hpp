#pragma once

#include "proxykeeper/proxy/RefillController.hpp"

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>

namespace proxykeeper::service {

// "<message> [----->·········] 4/20 (20%)"
std::string renderProgressBar(const std::string& message, std::size_t current, std::size_t total);

// Refill observer that redraws a single terminal line as the pool fills.
class ProgressReporter {
public:
    explicit ProgressReporter(std::ostream& out, std::string message = "Refill progress");

    void operator()(const proxy::RefillProgress& progress);

private:
    std::ostream& out_;
    std::string message_;
    std::mutex mutex_;
    std::string last_;
};

} // namespace proxykeeper::service
