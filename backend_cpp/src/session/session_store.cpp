#include "session/session_store.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace campus_rag {

SessionStore::SessionStore(std::shared_ptr<const Pipeline> pipeline,
                           size_t max_sessions,
                           std::chrono::seconds idle_ttl)
    : pipeline_(std::move(pipeline)), slots_(max_sessions, idle_ttl) {
    if (!pipeline_) {
        throw std::invalid_argument("SessionStore requires a pipeline");
    }
}

std::shared_ptr<SessionStore::Slot> SessionStore::acquire(const std::string& session_id,
                                                          ChatMode mode,
                                                          const std::string& locale) {
    const std::string id = session_id.empty() ? "default" : session_id;
    std::lock_guard<std::mutex> lock(mutex_);

    std::shared_ptr<Slot> slot = slots_.get(id).value_or(nullptr);
    if (!slot) {
        slot = std::make_shared<Slot>();
        slot->session = std::make_unique<ChatSession>(pipeline_, mode, locale, id);
        spdlog::info("New chat session: {}", id);
    }
    // Re-inserting refreshes the expiry.
    slots_.set(id, slot);
    return slot;
}

bool SessionStore::erase(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool removed = slots_.erase(session_id);
    if (removed) spdlog::info("Chat session closed: {}", session_id);
    return removed;
}

} // namespace campus_rag
