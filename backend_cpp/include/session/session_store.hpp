#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "cache_manager.hpp"
#include "chat_mode.hpp"
#include "graph/pipeline.hpp"
#include "session/chat_session.hpp"

namespace campus_rag {

// Live chat sessions keyed by client session id. Bounded by capacity (least
// recently used goes first) and by idle time; an evicted id starts fresh.
class SessionStore {
public:
    struct Slot {
        std::mutex mutex;  // serialises ask() on this session
        std::unique_ptr<ChatSession> session;
    };

    static constexpr size_t kDefaultMaxSessions = 1000;
    static constexpr std::chrono::seconds kDefaultIdleTtl{3600};

    explicit SessionStore(std::shared_ptr<const Pipeline> pipeline,
                          size_t max_sessions = kDefaultMaxSessions,
                          std::chrono::seconds idle_ttl = kDefaultIdleTtl);

    // Returns the session for the id, creating it with mode and locale when absent.
    // Every call restarts the idle clock.
    std::shared_ptr<Slot> acquire(const std::string& session_id, ChatMode mode, const std::string& locale);

    bool erase(const std::string& session_id);
    size_t size() const { return slots_.size(); }

private:
    std::shared_ptr<const Pipeline> pipeline_;
    LRUCache<std::string, std::shared_ptr<Slot>> slots_;
    std::mutex mutex_;
};

} // namespace campus_rag
