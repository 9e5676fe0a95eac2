#include "core/session_store.hpp"

namespace printvoice {
namespace core {

bool SessionStore::add(std::shared_ptr<VoiceSession> session) {
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = session->getSessionId();
    return sessions_.emplace(id, std::move(session)).second;
}

std::shared_ptr<VoiceSession> SessionStore::find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second : nullptr;
}

std::shared_ptr<VoiceSession> SessionStore::remove(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return nullptr;
    }
    auto session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionStore::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        result.push_back(entry.first);
    }
    return result;
}

std::vector<std::shared_ptr<VoiceSession>> SessionStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<VoiceSession>> result;
    result.reserve(sessions_.size());
    for (auto& entry : sessions_) {
        result.push_back(std::move(entry.second));
    }
    sessions_.clear();
    return result;
}

} // namespace core
} // namespace printvoice
