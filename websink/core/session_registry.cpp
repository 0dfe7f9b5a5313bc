/*
 * Session Registry
 */

#include "session_registry.h"
#include <mutex>

namespace websink {

SessionRegistry::SessionRegistry(UnblockSignal& signal)
    : signal_(signal)
{}

bool SessionRegistry::insert(const std::string& id, SessionPtr session) {
    size_t count;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!sessions_.emplace(id, std::move(session)).second) {
            return false;
        }
        count = sessions_.size();
    }
    publish(count);
    return true;
}

SessionRegistry::SessionPtr SessionRegistry::remove(const std::string& id) {
    SessionPtr removed;
    size_t count;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return nullptr;
        }
        removed = std::move(it->second);
        sessions_.erase(it);
        count = sessions_.size();
    }
    publish(count);
    return removed;
}

SessionRegistry::Snapshot SessionRegistry::drain() {
    Snapshot drained;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        drained.reserve(sessions_.size());
        for (auto& [id, session] : sessions_) {
            drained.push_back(std::move(session));
        }
        sessions_.clear();
    }
    if (!drained.empty()) {
        publish(0);
    }
    return drained;
}

size_t SessionRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionRegistry::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.count(id) != 0;
}

SessionRegistry::SessionPtr SessionRegistry::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

SessionRegistry::Snapshot SessionRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Snapshot result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

void SessionRegistry::publish(size_t count) {
    signal_.send(UnblockEvent::size_changed(count));
}

} // namespace websink
