//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventBuffer.hpp
// Purpose: Per-session ring buffer of server-to-client events replayable by Last-Event-ID
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

struct BufferedEvent {
    uint64_t id{0};
    std::string type;
    JSONValue payload;
};

//==========================================================================================================
// EventBuffer
// Purpose: Fixed-capacity buffer. Ids start at 1, strictly increase and are never reused (not even after
//          Clear()). Appending past capacity evicts the oldest event permanently.
//==========================================================================================================
class EventBuffer {
public:
    static constexpr std::size_t DefaultCapacity = 100;

    explicit EventBuffer(std::size_t capacity = DefaultCapacity);

    // Appends an event and returns its id. Wakes any WaitForEventsAfter callers.
    uint64_t Append(const std::string& type, JSONValue payload);

    // Events with id > lastEventId in id order (lastEventId == 0 returns everything retained).
    std::vector<BufferedEvent> ReplayFrom(uint64_t lastEventId) const;

    //======================================================================================================
    // WaitForEventsAfter
    // Purpose: Blocks until an event with id > lastEventId exists or the timeout elapses.
    // Returns:
    //   true when such an event is available.
    //======================================================================================================
    bool WaitForEventsAfter(uint64_t lastEventId, std::chrono::milliseconds timeout) const;

    // Id of the newest event, 0 when nothing was ever appended.
    uint64_t LatestId() const;
    std::size_t Size() const;
    std::size_t Capacity() const { return capacity; }
    void Clear();

private:
    std::size_t capacity;
    uint64_t nextId{1};
    std::deque<BufferedEvent> events;
    mutable std::mutex mutex;
    mutable std::condition_variable cv;
};

//==========================================================================================================
// EventBufferManager
// Purpose: Owns one EventBuffer per session id.
//==========================================================================================================
class EventBufferManager {
public:
    explicit EventBufferManager(std::size_t capacityPerSession = EventBuffer::DefaultCapacity);

    std::shared_ptr<EventBuffer> GetOrCreate(const std::string& sessionId);
    std::shared_ptr<EventBuffer> Get(const std::string& sessionId) const;
    void Remove(const std::string& sessionId);

    // Drops buffers whose session is not in activeSessionIds. Returns the number removed.
    std::size_t CleanupSessions(const std::unordered_set<std::string>& activeSessionIds);
    std::size_t Count() const;

private:
    std::size_t capacityPerSession;
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<EventBuffer>> buffers;
};

} // namespace mcpgw
