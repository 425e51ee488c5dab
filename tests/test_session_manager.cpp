//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_manager.cpp
// Purpose: Tests for session ids, lazy expiry, per-key caps and backend release detection
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <set>

#include "mcpgw/NativeBackend.hpp"
#include "mcpgw/SessionManager.hpp"
#include "mcpgw/errors/Errors.h"

using namespace mcpgw;
using namespace std::chrono_literals;

namespace {

struct ManualClock {
    SessionManager::Clock::time_point now{SessionManager::Clock::time_point{} + 1h};
    SessionManager::ClockFn fn() { return [this]() { return now; }; }
};

std::shared_ptr<ProtocolTransport> transport() {
    return std::make_shared<ProtocolTransport>("acme", "echo");
}

} // namespace

TEST(SessionManager, GeneratedIdsAreHexAndUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        std::string id = SessionManager::GenerateSessionId();
        ASSERT_EQ(id.size(), 32u);
        EXPECT_TRUE(std::all_of(id.begin(), id.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        })) << id;
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 200u);
}

TEST(SessionManager, CreateAndGet) {
    SessionManager manager;
    auto backend = MakeEchoBackend();
    auto t = transport();
    std::string id = manager.CreateSession("acme", "echo", backend, t, std::string("2025-06-18"));
    auto entry = manager.GetSession(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->tenantId, "acme");
    EXPECT_EQ(entry->connectorId, "echo");
    EXPECT_EQ(entry->backend.lock(), backend);
    EXPECT_EQ(entry->transport, t);
    EXPECT_EQ(entry->protocolVersion, std::optional<std::string>("2025-06-18"));
    EXPECT_FALSE(manager.GetSession("unknown").has_value());
    EXPECT_EQ(manager.SessionsForKey("acme", "echo"), std::vector<std::string>{id});
    EXPECT_TRUE(manager.SessionsForKey("acme", "other").empty());
}

TEST(SessionManager, IdleSessionsExpireLazily) {
    ManualClock clk;
    SessionManager manager(SessionManager::Options{60s, 10}, clk.fn());
    auto backend = MakeEchoBackend();
    std::string id = manager.CreateSession("acme", "echo", backend, transport());
    clk.now += 50s;
    ASSERT_TRUE(manager.GetSession(id).has_value());
    // The access above refreshed lastAccess
    clk.now += 50s;
    ASSERT_TRUE(manager.GetSession(id).has_value());
    clk.now += 61s;
    EXPECT_EQ(manager.ActiveSessionCount(), 0u);
    EXPECT_FALSE(manager.GetSession(id).has_value());
    EXPECT_TRUE(manager.ListSessionIds().empty());
}

TEST(SessionManager, ReleasedBackendEndsTheSession) {
    SessionManager manager;
    auto backend = MakeEchoBackend();
    auto t = transport();
    std::string id = manager.CreateSession("acme", "echo", backend, t);
    EXPECT_EQ(manager.ActiveSessionCount(), 1u);
    backend.reset();
    EXPECT_EQ(manager.ActiveSessionCount(), 0u);
    EXPECT_FALSE(manager.GetSession(id).has_value());
    EXPECT_EQ(t->CurrentState(), ProtocolTransport::State::Closed);
}

TEST(SessionManager, PerKeyCapEvictsOldest) {
    ManualClock clk;
    SessionManager manager(SessionManager::Options{3600s, 2}, clk.fn());
    auto backend = MakeEchoBackend();
    auto oldest = transport();
    std::string s1 = manager.CreateSession("acme", "echo", backend, oldest);
    clk.now += 1s;
    std::string s2 = manager.CreateSession("acme", "echo", backend, transport());
    std::string other = manager.CreateSession("globex", "echo", backend, transport());
    clk.now += 1s;
    // Touching s1 makes s2 the least recently used; eviction still goes by creation order
    ASSERT_TRUE(manager.GetSession(s1).has_value());
    clk.now += 1s;
    std::string s3 = manager.CreateSession("acme", "echo", backend, transport());

    EXPECT_FALSE(manager.GetSession(s1).has_value());
    EXPECT_TRUE(manager.GetSession(s2).has_value());
    EXPECT_TRUE(manager.GetSession(s3).has_value());
    EXPECT_TRUE(manager.GetSession(other).has_value());
    EXPECT_EQ(oldest->CurrentState(), ProtocolTransport::State::Closed);
}

TEST(SessionManager, CloseReapAndShutdown) {
    ManualClock clk;
    SessionManager manager(SessionManager::Options{60s, 10}, clk.fn());
    auto backend = MakeEchoBackend();
    std::string a = manager.CreateSession("acme", "echo", backend, transport());
    std::string b = manager.CreateSession("acme", "echo", backend, transport());
    EXPECT_TRUE(manager.CloseSession(a));
    EXPECT_FALSE(manager.CloseSession(a));

    clk.now += 120s;
    manager.CreateSession("acme", "echo", backend, transport());
    EXPECT_EQ(manager.ReapExpired(), 1u);
    EXPECT_FALSE(manager.GetSession(b).has_value());

    manager.Shutdown();
    EXPECT_TRUE(manager.IsShutdown());
    EXPECT_TRUE(manager.ListSessionIds().empty());
    EXPECT_THROW(manager.CreateSession("acme", "echo", backend, transport()), errors::GatewayError);
}
