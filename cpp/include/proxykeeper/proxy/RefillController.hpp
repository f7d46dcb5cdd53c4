#pragma once

#include "proxykeeper/proxy/Candidate.hpp"
#include "proxykeeper/proxy/ProviderClient.hpp"
#include "proxykeeper/proxy/ProxyStore.hpp"
#include "proxykeeper/proxy/ValidationCache.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace proxykeeper::proxy {

struct RefillSettings {
    std::size_t targetCount{20};
    unsigned int batchSize{20};
    unsigned int overFetchFactor{2};
    unsigned int providerMaxPerRequest{10};
    unsigned int maxAttempts{20};
    std::chrono::milliseconds retryDelay{std::chrono::seconds{1}};
    unsigned int concurrency{10};
    bool useCache{true};
    std::string protocol{"http"};
};

// Reported after the cache pass (attempt 0) and after every fetch attempt.
struct RefillProgress {
    unsigned int attempt{};
    unsigned int maxAttempts{};
    std::size_t poolSize{};
    std::size_t target{};
    std::size_t accepted{};
};

enum class RefillStatus {
    skipped,    // another cycle was already running
    satisfied,  // pool reached the target
    exhausted,  // attempt budget spent below the target
    faulted     // the cycle stopped on an unexpected exception
};

struct RefillOutcome {
    RefillStatus status{RefillStatus::skipped};
    unsigned int attempts{};
    std::size_t inserted{};
    std::size_t poolSize{};
};

using CandidateFetcher = std::function<std::vector<Candidate>(const BatchRequest&)>;
using CandidateValidator = std::function<bool(const Candidate&)>;
using RefillObserver = std::function<void(const RefillProgress&)>;

class RefillController {
public:
    RefillController(RefillSettings settings,
                     ProxyStore& store,
                     ValidationCache& cache,
                     CandidateFetcher fetcher,
                     CandidateValidator validator);

    // Runs one cycle on the calling thread. At most one cycle runs at a time; a call made
    // while another cycle is active returns immediately with RefillStatus::skipped.
    RefillOutcome refill();

    bool isRefilling() const { return refilling_.load(); }

    void setCountry(Country country) { country_.store(country); }
    Country country() const { return country_.load(); }

    void setObserver(RefillObserver observer);

    const RefillSettings& settings() const { return settings_; }

    // Provider batch size for the given shortfall.
    unsigned int batchCountFor(std::size_t needed) const;

private:
    struct ProbeResult {
        Candidate candidate;
        bool valid{};
    };

    void runCycle(RefillOutcome& outcome);
    std::size_t revalidateCached();
    std::vector<Candidate> filterNew(std::vector<Candidate> candidates) const;
    std::size_t validateAndCommit(const std::vector<Candidate>& candidates, bool honorCache);
    std::vector<ProbeResult> probeSubBatch(const std::vector<Candidate>& batch, bool honorCache);
    bool runValidator(const Candidate& candidate) const;
    std::size_t commit(const std::vector<ProbeResult>& results);
    void notify(unsigned int attempt, std::size_t accepted);
    void pause() const;

    RefillSettings settings_;
    ProxyStore& store_;
    ValidationCache& cache_;
    CandidateFetcher fetcher_;
    CandidateValidator validator_;
    std::atomic<bool> refilling_{false};
    std::atomic<Country> country_{Country::us};
    std::mutex observerMutex_;
    RefillObserver observer_;
    boost::asio::thread_pool probes_;
};

} // namespace proxykeeper::proxy
