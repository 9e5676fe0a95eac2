#pragma once

#include "core/voice_session.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace printvoice {
namespace core {

/**
 * Live sessions keyed by connection id. Entries are added on connect and
 * removed on disconnect or idle timeout; nothing is persisted.
 */
class SessionStore {
public:
    // Returns false if the id is already present
    bool add(std::shared_ptr<VoiceSession> session);

    std::shared_ptr<VoiceSession> find(const std::string& sessionId) const;

    // The removed session, or null if it was not present
    std::shared_ptr<VoiceSession> remove(const std::string& sessionId);

    size_t size() const;
    std::vector<std::string> ids() const;

    // Removes and returns all sessions
    std::vector<std::shared_ptr<VoiceSession>> clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<VoiceSession>> sessions_;
};

} // namespace core
} // namespace printvoice
