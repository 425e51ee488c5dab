//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_pool.cpp
// Purpose: Tests for the backend pool: hits and misses, TTL, LRU eviction, invalidation, shutdown
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "mcpgw/ServerPool.hpp"
#include "mcpgw/errors/Errors.h"

using namespace mcpgw;
using namespace std::chrono_literals;

namespace {

class FakeBackend : public IBackend {
public:
    explicit FakeBackend(bool initOk = true) : initOk(initOk) {}

    bool Initialize() override { ++initCalls; return initOk; }
    std::future<JSONValue> Send(const std::string&, const std::optional<JSONValue>&) override {
        std::promise<JSONValue> p;
        p.set_value(JSONValue(JSONValue::Object{}));
        return p.get_future();
    }
    void SetUserToken(const std::string& t) override { std::lock_guard<std::mutex> l(m); token = t; }
    std::optional<std::string> UserToken() const override { std::lock_guard<std::mutex> l(m); return token; }
    void SetNotificationSink(BackendNotificationSink) override {}
    void Close() override { closed = true; }
    BackendKind Kind() const override { return BackendKind::Native; }

    bool initOk;
    std::atomic<int> initCalls{0};
    std::atomic<bool> closed{false};

private:
    mutable std::mutex m;
    std::optional<std::string> token;
};

struct ManualClock {
    ServerPool::Clock::time_point now{ServerPool::Clock::time_point{} + 1h};
    ServerPool::ClockFn fn() { return [this]() { return now; }; }
};

struct Recorder {
    std::mutex m;
    std::vector<std::shared_ptr<FakeBackend>> made;
    BackendFactory factory(bool initOk = true) {
        return [this, initOk](const std::string&, const std::string&, const std::optional<std::string>& token) {
            auto b = std::make_shared<FakeBackend>(initOk);
            if (token) b->SetUserToken(*token);
            std::lock_guard<std::mutex> l(m);
            made.push_back(b);
            return b;
        };
    }
};

} // namespace

TEST(ServerPool, SecondLookupIsAHit) {
    Recorder rec;
    ServerPool pool(rec.factory(), ServerPool::Options{});
    auto a = pool.GetOrCreate("acme", "github");
    auto b = pool.GetOrCreate("acme", "github");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(pool.Hits(), 1u);
    EXPECT_EQ(pool.Misses(), 1u);
    EXPECT_EQ(rec.made.size(), 1u);
    EXPECT_EQ(rec.made[0]->initCalls.load(), 1);

    auto other = pool.GetOrCreate("globex", "github");
    EXPECT_NE(other, a);
    EXPECT_EQ(pool.Size(), 2u);
}

TEST(ServerPool, TokenIsOverlaidOnHits) {
    Recorder rec;
    ServerPool pool(rec.factory(), ServerPool::Options{});
    auto a = pool.GetOrCreate("acme", "github", std::string("t1"));
    EXPECT_EQ(a->UserToken(), std::optional<std::string>("t1"));
    pool.GetOrCreate("acme", "github", std::string("t2"));
    EXPECT_EQ(a->UserToken(), std::optional<std::string>("t2"));
    // No token on the lookup leaves the current one in place
    pool.GetOrCreate("acme", "github");
    EXPECT_EQ(a->UserToken(), std::optional<std::string>("t2"));
}

TEST(ServerPool, FailedInitializeIsNotCached) {
    Recorder rec;
    ServerPool pool(rec.factory(false), ServerPool::Options{});
    EXPECT_EQ(pool.GetOrCreate("acme", "broken"), nullptr);
    EXPECT_EQ(pool.Size(), 0u);
    ASSERT_EQ(rec.made.size(), 1u);
    EXPECT_TRUE(rec.made[0]->closed);
    // Next call tries again
    EXPECT_EQ(pool.GetOrCreate("acme", "broken"), nullptr);
    EXPECT_EQ(rec.made.size(), 2u);
}

TEST(ServerPool, FactoryFailuresYieldNull) {
    ServerPool nullFactory([](const std::string&, const std::string&, const std::optional<std::string>&) {
        return std::shared_ptr<IBackend>();
    }, ServerPool::Options{});
    EXPECT_EQ(nullFactory.GetOrCreate("acme", "x"), nullptr);

    ServerPool throwing([](const std::string&, const std::string&, const std::optional<std::string>&)
                            -> std::shared_ptr<IBackend> { throw std::runtime_error("no such connector"); },
                        ServerPool::Options{});
    EXPECT_EQ(throwing.GetOrCreate("acme", "x"), nullptr);
}

TEST(ServerPool, ExpiredEntriesAreReplaced) {
    Recorder rec;
    ManualClock clk;
    ServerPool pool(rec.factory(), ServerPool::Options{10, 60s}, clk.fn());
    auto first = pool.GetOrCreate("acme", "github");
    clk.now += 30s;
    EXPECT_EQ(pool.GetOrCreate("acme", "github"), first);
    // TTL counts from creation, not last access
    clk.now += 31s;
    auto second = pool.GetOrCreate("acme", "github");
    EXPECT_NE(second, first);
    EXPECT_TRUE(rec.made[0]->closed);
    EXPECT_EQ(pool.Misses(), 2u);
}

TEST(ServerPool, ReapExpiredClosesHandles) {
    Recorder rec;
    ManualClock clk;
    ServerPool pool(rec.factory(), ServerPool::Options{10, 60s}, clk.fn());
    pool.GetOrCreate("acme", "a");
    clk.now += 45s;
    pool.GetOrCreate("acme", "b");
    clk.now += 30s;
    EXPECT_EQ(pool.ReapExpired(), 1u);
    EXPECT_EQ(pool.Size(), 1u);
    EXPECT_TRUE(rec.made[0]->closed);
    EXPECT_FALSE(rec.made[1]->closed);
}

TEST(ServerPool, EvictsLeastRecentlyUsedAtCapacity) {
    Recorder rec;
    ManualClock clk;
    ServerPool pool(rec.factory(), ServerPool::Options{2, 3600s}, clk.fn());
    auto a = pool.GetOrCreate("t", "a");
    clk.now += 1s;
    pool.GetOrCreate("t", "b");
    clk.now += 1s;
    // Touch a so that b becomes the LRU entry
    EXPECT_EQ(pool.GetOrCreate("t", "a"), a);
    clk.now += 1s;
    pool.GetOrCreate("t", "c");
    EXPECT_EQ(pool.Size(), 2u);
    EXPECT_FALSE(rec.made[0]->closed);
    EXPECT_TRUE(rec.made[1]->closed);
    EXPECT_EQ(pool.GetOrCreate("t", "a"), a);
}

TEST(ServerPool, InvalidateAndInvalidateTenant) {
    Recorder rec;
    ServerPool pool(rec.factory(), ServerPool::Options{});
    pool.GetOrCreate("acme", "a");
    pool.GetOrCreate("acme", "b");
    pool.GetOrCreate("globex", "a");
    pool.Invalidate("acme", "a");
    EXPECT_EQ(pool.Size(), 2u);
    EXPECT_TRUE(rec.made[0]->closed);
    pool.InvalidateTenant("acme");
    EXPECT_EQ(pool.Size(), 1u);
    EXPECT_TRUE(rec.made[1]->closed);
    EXPECT_FALSE(rec.made[2]->closed);
    // Unknown keys are ignored
    EXPECT_NO_THROW(pool.Invalidate("nobody", "none"));
}

TEST(ServerPool, ConcurrentFirstCallersShareOneCreation) {
    std::atomic<int> created{0};
    ServerPool pool([&](const std::string&, const std::string&, const std::optional<std::string>&) {
        ++created;
        std::this_thread::sleep_for(50ms);
        return std::make_shared<FakeBackend>();
    }, ServerPool::Options{});

    std::vector<std::shared_ptr<IBackend>> results(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i]() { results[i] = pool.GetOrCreate("acme", "slow"); });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(created.load(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r, results[0]);
    }
}

TEST(ServerPool, WaitersOnAFailedCreationCountAsMisses) {
    std::atomic<int> created{0};
    ServerPool pool([&](const std::string&, const std::string&, const std::optional<std::string>&) {
        ++created;
        std::this_thread::sleep_for(100ms);
        return std::shared_ptr<IBackend>();
    }, ServerPool::Options{});

    std::vector<std::shared_ptr<IBackend>> results(6);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i]() { results[i] = pool.GetOrCreate("acme", "broken"); });
    }
    for (auto& t : threads) t.join();
    for (const auto& r : results) {
        EXPECT_EQ(r, nullptr);
    }
    EXPECT_EQ(pool.Hits(), 0u);
    EXPECT_EQ(pool.Misses(), results.size());
    EXPECT_GE(created.load(), 1);
    EXPECT_EQ(pool.Size(), 0u);
}

TEST(ServerPool, ShutdownClosesEverythingAndRejectsCalls) {
    Recorder rec;
    ServerPool pool(rec.factory(), ServerPool::Options{});
    pool.GetOrCreate("acme", "a");
    pool.GetOrCreate("acme", "b");
    pool.Shutdown();
    EXPECT_TRUE(pool.IsShutdown());
    EXPECT_EQ(pool.Size(), 0u);
    for (const auto& b : rec.made) {
        EXPECT_TRUE(b->closed);
    }
    EXPECT_THROW(pool.GetOrCreate("acme", "a"), errors::GatewayError);
    EXPECT_NO_THROW(pool.Shutdown());
}

TEST(ServerPool, MakeKey) {
    EXPECT_EQ(ServerPool::MakeKey("acme", "github"), "acme:github");
}
