#include "proxykeeper/proxy/RefillController.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;
using namespace proxykeeper::proxy;

namespace {

Candidate candidate(const std::string& host, std::uint16_t port = 8080) {
    return Candidate{host, port, "", ""};
}

RefillSettings quickSettings(std::size_t target) {
    RefillSettings settings;
    settings.targetCount = target;
    settings.retryDelay = 0ms;
    settings.maxAttempts = 3;
    return settings;
}

class RefillControllerTest : public ::testing::Test {
protected:
    ProxyStore store;
    ValidationCache cache{1h};
    std::atomic<int> fetches{0};
    std::atomic<int> probes{0};

    CandidateFetcher fixedBatch(std::vector<Candidate> batch) {
        return [this, batch](const BatchRequest&) {
            ++fetches;
            return batch;
        };
    }

    CandidateValidator acceptAll() {
        return [this](const Candidate&) {
            ++probes;
            return true;
        };
    }
};

} // namespace

TEST_F(RefillControllerTest, FillsPoolAndCyclesInOrder) {
    auto settings = quickSettings(3);
    settings.concurrency = 2;
    RefillController controller{settings, store, cache,
                                fixedBatch({candidate("a"), candidate("b"), candidate("c")}), acceptAll()};

    auto outcome = controller.refill();
    EXPECT_EQ(outcome.status, RefillStatus::satisfied);
    EXPECT_EQ(outcome.inserted, 3u);
    EXPECT_EQ(outcome.attempts, 1u);
    EXPECT_EQ(store.size(), 3u);
    EXPECT_FALSE(controller.isRefilling());

    std::vector<std::string> order;
    for (int i = 0; i < 4; ++i) {
        order.push_back(store.acquire()->host);
    }
    EXPECT_EQ(order, (std::vector<std::string>{"a", "b", "c", "a"}));
}

TEST_F(RefillControllerTest, SkipsCandidatesAlreadyPooled) {
    store.insertIfAbsent(makeValidatedProxy(candidate("a"), "http"));
    std::vector<std::string> probed;
    std::mutex probedMutex;
    CandidateValidator validator = [&](const Candidate& c) {
        std::scoped_lock lock(probedMutex);
        probed.push_back(c.host);
        return true;
    };
    RefillController controller{quickSettings(2), store, cache,
                                fixedBatch({candidate("a"), candidate("b"), candidate("b")}), validator};

    auto outcome = controller.refill();
    EXPECT_EQ(outcome.status, RefillStatus::satisfied);
    EXPECT_EQ(probed, (std::vector<std::string>{"b"}));
    EXPECT_EQ(store.size(), 2u);
}

TEST_F(RefillControllerTest, ExhaustsAttemptsWhenProviderIsEmpty) {
    auto settings = quickSettings(5);
    settings.maxAttempts = 2;
    RefillController controller{settings, store, cache, fixedBatch({}), acceptAll()};

    auto outcome = controller.refill();
    EXPECT_EQ(outcome.status, RefillStatus::exhausted);
    EXPECT_EQ(outcome.attempts, 2u);
    EXPECT_EQ(outcome.poolSize, 0u);
    EXPECT_EQ(fetches.load(), 2);
    EXPECT_EQ(probes.load(), 0);
    EXPECT_FALSE(controller.isRefilling());
}

TEST_F(RefillControllerTest, SatisfiedPoolSkipsWork) {
    store.insertIfAbsent(makeValidatedProxy(candidate("a"), "http"));
    RefillController controller{quickSettings(1), store, cache, fixedBatch({candidate("b")}), acceptAll()};

    auto outcome = controller.refill();
    EXPECT_EQ(outcome.status, RefillStatus::satisfied);
    EXPECT_EQ(outcome.attempts, 0u);
    EXPECT_EQ(fetches.load(), 0);
}

TEST_F(RefillControllerTest, StopsProbingOnceTargetIsReached) {
    auto settings = quickSettings(5);
    settings.concurrency = 5;
    std::vector<Candidate> batch;
    for (int i = 0; i < 10; ++i) {
        batch.push_back(candidate("10.0.0." + std::to_string(i)));
    }
    RefillController controller{settings, store, cache, fixedBatch(batch), acceptAll()};

    auto outcome = controller.refill();
    EXPECT_EQ(outcome.status, RefillStatus::satisfied);
    EXPECT_EQ(store.size(), 5u);
    EXPECT_EQ(probes.load(), 5);
}

TEST_F(RefillControllerTest, RejectsInvalidCandidatesAndCachesThem) {
    CandidateValidator validator = [this](const Candidate& c) {
        ++probes;
        if (c.host == "boom") {
            throw std::runtime_error("probe exploded");
        }
        return c.host == "good";
    };
    auto settings = quickSettings(1);
    settings.maxAttempts = 1;
    RefillController controller{settings, store, cache,
                                fixedBatch({candidate("bad"), candidate("boom"), candidate("good")}), validator};

    auto outcome = controller.refill();
    EXPECT_EQ(outcome.status, RefillStatus::satisfied);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.acquire()->host, "good");
    EXPECT_EQ(cache.findFresh(candidate("bad").identity()), std::optional<bool>{false});
    EXPECT_EQ(cache.findFresh(candidate("boom").identity()), std::optional<bool>{false});
    EXPECT_EQ(cache.findFresh(candidate("good").identity()), std::optional<bool>{true});
}

TEST_F(RefillControllerTest, FreshCacheVerdictAvoidsProbe) {
    cache.put(candidate("known-bad").identity(), false);
    std::vector<std::string> probed;
    std::mutex probedMutex;
    CandidateValidator validator = [&](const Candidate& c) {
        std::scoped_lock lock(probedMutex);
        probed.push_back(c.host);
        return true;
    };
    auto settings = quickSettings(2);
    settings.maxAttempts = 1;
    RefillController controller{settings, store, cache,
                                fixedBatch({candidate("known-bad"), candidate("new")}), validator};

    auto outcome = controller.refill();
    EXPECT_EQ(outcome.status, RefillStatus::exhausted);
    EXPECT_EQ(probed, (std::vector<std::string>{"new"}));
    EXPECT_FALSE(store.contains(candidate("known-bad").identity()));
}

TEST_F(RefillControllerTest, CacheDisabledProbesEverything) {
    cache.put(candidate("known-bad").identity(), false);
    auto settings = quickSettings(2);
    settings.useCache = false;
    RefillController controller{settings, store, cache,
                                fixedBatch({candidate("known-bad"), candidate("new")}), acceptAll()};

    auto outcome = controller.refill();
    EXPECT_EQ(outcome.status, RefillStatus::satisfied);
    EXPECT_EQ(probes.load(), 2);
}

TEST_F(RefillControllerTest, RevalidatesCachedProxiesBeforeFetching) {
    cache.put(candidate("cached").identity(), true);
    RefillController controller{quickSettings(1), store, cache, fixedBatch({candidate("fetched")}), acceptAll()};

    auto outcome = controller.refill();
    EXPECT_EQ(outcome.status, RefillStatus::satisfied);
    EXPECT_EQ(outcome.attempts, 0u);
    EXPECT_EQ(fetches.load(), 0);
    EXPECT_EQ(probes.load(), 1);
    EXPECT_TRUE(store.contains(candidate("cached").identity()));
}

TEST_F(RefillControllerTest, CachedProxyFailingReprobeIsNotPooled) {
    cache.put(candidate("cached").identity(), true);
    CandidateValidator validator = [this](const Candidate& c) {
        ++probes;
        return c.host != "cached";
    };
    RefillController controller{quickSettings(1), store, cache, fixedBatch({candidate("fetched")}), validator};

    auto outcome = controller.refill();
    EXPECT_EQ(outcome.status, RefillStatus::satisfied);
    EXPECT_EQ(fetches.load(), 1);
    EXPECT_FALSE(store.contains(candidate("cached").identity()));
    EXPECT_TRUE(store.contains(candidate("fetched").identity()));
    EXPECT_EQ(cache.findFresh(candidate("cached").identity()), std::optional<bool>{false});
}

TEST_F(RefillControllerTest, OnlyOneCycleRunsAtATime) {
    std::promise<void> entered;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();
    std::atomic<bool> signalled{false};

    CandidateValidator validator = [&](const Candidate&) {
        if (!signalled.exchange(true)) {
            entered.set_value();
        }
        releaseFuture.wait();
        return true;
    };
    RefillController controller{quickSettings(1), store, cache, fixedBatch({candidate("a")}), validator};

    auto first = std::async(std::launch::async, [&controller]() { return controller.refill(); });
    entered.get_future().wait();
    EXPECT_TRUE(controller.isRefilling());

    auto second = controller.refill();
    EXPECT_EQ(second.status, RefillStatus::skipped);

    release.set_value();
    EXPECT_EQ(first.get().status, RefillStatus::satisfied);
    EXPECT_FALSE(controller.isRefilling());
}

TEST_F(RefillControllerTest, FetcherFaultClearsRefillingFlag) {
    int calls = 0;
    CandidateFetcher fetcher = [&calls](const BatchRequest&) -> std::vector<Candidate> {
        if (++calls == 1) {
            throw std::runtime_error("provider down");
        }
        return {Candidate{"a", 80, "", ""}};
    };
    RefillController controller{quickSettings(1), store, cache, fetcher, acceptAll()};

    EXPECT_EQ(controller.refill().status, RefillStatus::faulted);
    EXPECT_FALSE(controller.isRefilling());
    EXPECT_EQ(controller.refill().status, RefillStatus::satisfied);
}

TEST_F(RefillControllerTest, ReportsProgressPerAttempt) {
    cache.put(candidate("stale-bad").identity(), false);
    std::vector<unsigned int> attempts;
    RefillController controller{quickSettings(2), store, cache, fixedBatch({}), acceptAll()};
    controller.setObserver([&attempts](const RefillProgress& progress) {
        attempts.push_back(progress.attempt);
        EXPECT_EQ(progress.target, 2u);
        EXPECT_EQ(progress.maxAttempts, 3u);
    });

    controller.refill();
    EXPECT_EQ(attempts, (std::vector<unsigned int>{0, 1, 2, 3}));
}

TEST_F(RefillControllerTest, RequestsCarryCountryAndOverFetch) {
    auto settings = quickSettings(4);
    settings.batchSize = 1;
    settings.overFetchFactor = 2;
    settings.maxAttempts = 1;
    settings.protocol = "socks5";
    BatchRequest seen;
    CandidateFetcher fetcher = [&seen](const BatchRequest& request) {
        seen = request;
        return std::vector<Candidate>{};
    };
    RefillController controller{settings, store, cache, fetcher, acceptAll()};
    controller.setCountry(Country::de);

    controller.refill();
    EXPECT_EQ(seen.country, Country::de);
    EXPECT_EQ(seen.protocol, "socks5");
    EXPECT_EQ(seen.count, 8u);
}

TEST_F(RefillControllerTest, BatchCountIsCapped) {
    RefillSettings settings;
    RefillController controller{settings, store, cache, fixedBatch({}), acceptAll()};
    EXPECT_EQ(controller.batchCountFor(3), 10u);
    EXPECT_EQ(controller.batchCountFor(50), 10u);

    settings.providerMaxPerRequest = 100;
    RefillController wide{settings, store, cache, fixedBatch({}), acceptAll()};
    EXPECT_EQ(wide.batchCountFor(5), 20u);
    EXPECT_EQ(wide.batchCountFor(30), 60u);
}
