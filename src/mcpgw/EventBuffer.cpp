//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventBuffer.cpp
// Purpose: Event ring buffer and per-session buffer registry
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpgw/EventBuffer.hpp"

namespace mcpgw {

EventBuffer::EventBuffer(std::size_t cap) : capacity(cap == 0 ? 1 : cap) {}

uint64_t EventBuffer::Append(const std::string& type, JSONValue payload) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        id = nextId++;
        events.push_back(BufferedEvent{id, type, std::move(payload)});
        while (events.size() > capacity) {
            events.pop_front();
        }
    }
    cv.notify_all();
    return id;
}

std::vector<BufferedEvent> EventBuffer::ReplayFrom(uint64_t lastEventId) const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<BufferedEvent> out;
    for (const auto& ev : events) {
        if (ev.id > lastEventId) {
            out.push_back(ev);
        }
    }
    return out;
}

bool EventBuffer::WaitForEventsAfter(uint64_t lastEventId, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [&]{ return nextId - 1 > lastEventId; });
}

uint64_t EventBuffer::LatestId() const {
    std::lock_guard<std::mutex> lock(mutex);
    return nextId - 1;
}

std::size_t EventBuffer::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return events.size();
}

void EventBuffer::Clear() {
    std::lock_guard<std::mutex> lock(mutex);
    events.clear();
}

EventBufferManager::EventBufferManager(std::size_t capacity) : capacityPerSession(capacity) {}

std::shared_ptr<EventBuffer> EventBufferManager::GetOrCreate(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto& slot = buffers[sessionId];
    if (!slot) {
        slot = std::make_shared<EventBuffer>(capacityPerSession);
    }
    return slot;
}

std::shared_ptr<EventBuffer> EventBufferManager::Get(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = buffers.find(sessionId);
    return (it != buffers.end()) ? it->second : nullptr;
}

void EventBufferManager::Remove(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex);
    buffers.erase(sessionId);
}

std::size_t EventBufferManager::CleanupSessions(const std::unordered_set<std::string>& activeSessionIds) {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t removed = 0;
    for (auto it = buffers.begin(); it != buffers.end();) {
        if (activeSessionIds.count(it->first) == 0) {
            it = buffers.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LOG_DEBUG("EventBufferManager: dropped {} buffers for closed sessions", removed);
    }
    return removed;
}

std::size_t EventBufferManager::Count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return buffers.size();
}

} // namespace mcpgw
