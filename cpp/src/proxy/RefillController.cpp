#include "proxykeeper/proxy/RefillController.hpp"

#include "proxykeeper/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <condition_variable>
#include <thread>
#include <unordered_set>

namespace proxykeeper::proxy {
namespace {

// Clears the single-flight flag however the cycle ends.
struct RefillingGuard {
    std::atomic<bool>& flag;
    ~RefillingGuard() { flag.store(false); }
};

std::string poolStatus(std::size_t size, std::size_t target) {
    return std::to_string(size) + "/" + std::to_string(target);
}

} // namespace

RefillController::RefillController(RefillSettings settings,
                                   ProxyStore& store,
                                   ValidationCache& cache,
                                   CandidateFetcher fetcher,
                                   CandidateValidator validator)
    : settings_(std::move(settings))
    , store_(store)
    , cache_(cache)
    , fetcher_(std::move(fetcher))
    , validator_(std::move(validator))
    , probes_(std::max(1u, settings_.concurrency)) {}

void RefillController::setObserver(RefillObserver observer) {
    std::scoped_lock lock(observerMutex_);
    observer_ = std::move(observer);
}

unsigned int RefillController::batchCountFor(std::size_t needed) const {
    const std::size_t wanted = std::max<std::size_t>(settings_.batchSize, needed * settings_.overFetchFactor);
    const std::size_t cap = std::max(1u, settings_.providerMaxPerRequest);
    return static_cast<unsigned int>(std::clamp<std::size_t>(wanted, 1, cap));
}

RefillOutcome RefillController::refill() {
    RefillOutcome outcome;
    bool expected = false;
    if (!refilling_.compare_exchange_strong(expected, true)) {
        util::log(util::LogLevel::debug, "Refill already in progress, trigger ignored");
        outcome.poolSize = store_.size();
        return outcome;
    }
    RefillingGuard guard{refilling_};

    try {
        runCycle(outcome);
    } catch (const std::exception& ex) {
        outcome.status = RefillStatus::faulted;
        util::log(util::LogLevel::error, std::string{"Proxy pool refill failed: "} + ex.what());
    }

    outcome.poolSize = store_.size();
    const auto status = poolStatus(outcome.poolSize, settings_.targetCount);
    switch (outcome.status) {
    case RefillStatus::satisfied:
        util::log(util::LogLevel::info, "Proxy pool refill complete, available proxies: " + status);
        break;
    case RefillStatus::exhausted:
        util::log(util::LogLevel::info,
                  "Reached max refill attempts " + std::to_string(settings_.maxAttempts) +
                      ", available proxies: " + status);
        break;
    default:
        break;
    }
    return outcome;
}

void RefillController::runCycle(RefillOutcome& outcome) {
    const auto target = settings_.targetCount;
    if (store_.size() >= target) {
        outcome.status = RefillStatus::satisfied;
        return;
    }

    util::log(util::LogLevel::info,
              "Refilling proxy pool, current " + poolStatus(store_.size(), target));

    if (settings_.useCache && !cache_.empty()) {
        const auto accepted = revalidateCached();
        outcome.inserted += accepted;
        notify(0, accepted);
    }

    for (unsigned int attempt = 1; attempt <= settings_.maxAttempts && store_.size() < target; ++attempt) {
        outcome.attempts = attempt;
        const bool lastAttempt = attempt == settings_.maxAttempts;
        const auto needed = target - store_.size();

        util::log(util::LogLevel::debug,
                  "Refill attempt #" + std::to_string(attempt) + ", available " + poolStatus(store_.size(), target));

        BatchRequest request;
        request.country = country_.load();
        request.protocol = settings_.protocol;
        request.count = batchCountFor(needed);

        auto candidates = fetcher_(request);
        if (candidates.empty()) {
            util::log(util::LogLevel::debug,
                      "No candidates received, retrying in " + std::to_string(settings_.retryDelay.count()) + "ms");
            notify(attempt, 0);
            if (!lastAttempt) {
                pause();
            }
            continue;
        }

        auto fresh = filterNew(std::move(candidates));
        if (fresh.empty()) {
            util::log(util::LogLevel::debug, "Every candidate is already pooled, fetching again");
            notify(attempt, 0);
            continue;
        }

        const auto accepted = validateAndCommit(fresh, true);
        outcome.inserted += accepted;
        notify(attempt, accepted);

        if (store_.size() < target && !lastAttempt) {
            pause();
        }
    }

    outcome.status = store_.size() >= target ? RefillStatus::satisfied : RefillStatus::exhausted;
}

std::size_t RefillController::revalidateCached() {
    const auto size = store_.size();
    if (size >= settings_.targetCount) {
        return 0;
    }
    const auto needed = settings_.targetCount - size;

    auto identities = cache_.freshKeys(
        [this](const ProxyIdentity& identity, bool valid) { return valid && !store_.contains(identity); },
        needed);
    if (identities.empty()) {
        return 0;
    }

    util::log(util::LogLevel::debug,
              "Found " + std::to_string(identities.size()) + " possibly usable proxies in cache");

    std::vector<Candidate> candidates;
    candidates.reserve(identities.size());
    for (const auto& identity : identities) {
        candidates.push_back(candidateFrom(identity));
    }
    // A cached pass is only a hint, every one of them is probed again.
    return validateAndCommit(candidates, false);
}

std::vector<Candidate> RefillController::filterNew(std::vector<Candidate> candidates) const {
    std::unordered_set<ProxyIdentity, ProxyIdentityHash> seen;
    std::vector<Candidate> fresh;
    fresh.reserve(candidates.size());
    for (auto& candidate : candidates) {
        auto identity = candidate.identity();
        if (store_.contains(identity) || !seen.insert(std::move(identity)).second) {
            continue;
        }
        fresh.push_back(std::move(candidate));
    }
    return fresh;
}

std::size_t RefillController::validateAndCommit(const std::vector<Candidate>& candidates, bool honorCache) {
    const std::size_t step = std::max(1u, settings_.concurrency);
    std::size_t accepted = 0;

    for (std::size_t offset = 0; offset < candidates.size(); offset += step) {
        if (store_.size() >= settings_.targetCount) {
            util::log(util::LogLevel::debug, "Target reached, skipping remaining candidates");
            break;
        }
        const auto end = std::min(candidates.size(), offset + step);
        std::vector<Candidate> subBatch(candidates.begin() + static_cast<std::ptrdiff_t>(offset),
                                        candidates.begin() + static_cast<std::ptrdiff_t>(end));
        accepted += commit(probeSubBatch(subBatch, honorCache));
    }
    return accepted;
}

std::vector<RefillController::ProbeResult> RefillController::probeSubBatch(const std::vector<Candidate>& batch,
                                                                           bool honorCache) {
    // Results keep the order of the batch, whatever order the probes finish in.
    std::vector<ProbeResult> results;
    std::vector<std::size_t> toProbe;
    results.reserve(batch.size());

    for (const auto& candidate : batch) {
        results.push_back({candidate, false});
        if (honorCache && settings_.useCache) {
            if (auto cached = cache_.findFresh(candidate.identity())) {
                results.back().valid = *cached;
                continue;
            }
        }
        toProbe.push_back(results.size() - 1);
    }

    if (toProbe.empty()) {
        return results;
    }

    std::mutex mutex;
    std::condition_variable finished;
    std::size_t pending = toProbe.size();

    for (auto index : toProbe) {
        boost::asio::post(probes_, [this, index, &mutex, &finished, &pending, &results]() {
            const auto& candidate = results[index].candidate;
            const bool valid = runValidator(candidate);
            if (settings_.useCache) {
                cache_.put(candidate.identity(), valid);
            }
            std::scoped_lock lock(mutex);
            results[index].valid = valid;
            if (--pending == 0) {
                finished.notify_all();
            }
        });
    }

    std::unique_lock lock(mutex);
    finished.wait(lock, [&pending]() { return pending == 0; });
    return results;
}

bool RefillController::runValidator(const Candidate& candidate) const {
    try {
        return validator_(candidate);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug,
                  "Validator threw for " + candidate.toString() + ": " + ex.what());
    }
    return false;
}

std::size_t RefillController::commit(const std::vector<ProbeResult>& results) {
    std::size_t accepted = 0;
    for (const auto& result : results) {
        if (!result.valid) {
            continue;
        }
        auto proxy = makeValidatedProxy(result.candidate, settings_.protocol);
        const auto uri = proxy.uri;
        if (store_.insertIfAbsent(std::move(proxy))) {
            ++accepted;
            util::log(util::LogLevel::debug,
                      "Added proxy " + uri + ", available " + poolStatus(store_.size(), settings_.targetCount));
        }
    }
    return accepted;
}

void RefillController::notify(unsigned int attempt, std::size_t accepted) {
    RefillObserver observer;
    {
        std::scoped_lock lock(observerMutex_);
        observer = observer_;
    }
    if (!observer) {
        return;
    }
    RefillProgress progress;
    progress.attempt = attempt;
    progress.maxAttempts = settings_.maxAttempts;
    progress.poolSize = store_.size();
    progress.target = settings_.targetCount;
    progress.accepted = accepted;
    observer(progress);
}

void RefillController::pause() const {
    if (settings_.retryDelay.count() > 0) {
        std::this_thread::sleep_for(settings_.retryDelay);
    }
}

} // namespace proxykeeper::proxy
