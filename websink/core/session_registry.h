/*
 * Session Registry
 *
 * Concurrent map from peer id to PeerSession; the single source of truth
 * for who is connected. Readers (fan-out, count) share the lock,
 * insert/remove take it exclusively. Every mutation publishes the new size
 * on the unblock signal once the lock is released.
 */

#ifndef SESSION_REGISTRY_H
#define SESSION_REGISTRY_H

#include "peer_session.h"
#include "unblock_signal.h"
#include <string>
#include <vector>
#include <memory>
#include <map>
#include <shared_mutex>

namespace websink {

class SessionRegistry {
public:
    using SessionPtr = std::shared_ptr<PeerSession>;
    using Snapshot = std::vector<SessionPtr>;

    explicit SessionRegistry(UnblockSignal& signal);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * Register a session
     * @return false if the id is already present (registry unchanged)
     */
    bool insert(const std::string& id, SessionPtr session);

    /**
     * Remove a session
     *
     * Idempotent: removing an absent id returns nullptr and changes nothing.
     * The caller that receives the entry owns closing it.
     */
    SessionPtr remove(const std::string& id);

    // Remove every session, returning them for the caller to close
    Snapshot drain();

    size_t count() const;
    bool contains(const std::string& id) const;
    SessionPtr find(const std::string& id) const;

    // Consistent copy of the current sessions, safe to iterate unlocked
    Snapshot snapshot() const;

private:
    void publish(size_t count);

    UnblockSignal& signal_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, SessionPtr> sessions_;
};

} // namespace websink

#endif // SESSION_REGISTRY_H
