/*
 * Peer Session
 *
 * One admitted browser peer: its id, its transport and the last
 * connection state reported by the transport. The registry entry owns the
 * session; whoever removes it from the registry closes it.
 */

#ifndef PEER_SESSION_H
#define PEER_SESSION_H

#include "peer_transport.h"
#include <string>
#include <memory>
#include <atomic>

namespace websink {

class PeerSession {
public:
    PeerSession(std::string id, std::shared_ptr<PeerTransport> transport);
    ~PeerSession();

    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;

    const std::string& id() const { return id_; }

    PeerState state() const { return state_.load(); }
    void set_state(PeerState state) { state_.store(state); }

    bool is_closed() const { return closed_.load(); }

    /**
     * Send one sample to this peer
     * @return false if the session is closed or its transport is not ready
     * @throws std::exception if the transport rejects the sample
     */
    bool deliver(const EncodedSample& sample);

    // Close the transport. Only the first call has an effect.
    // Returns true for the call that actually closed it.
    bool close();

private:
    std::string id_;
    std::shared_ptr<PeerTransport> transport_;
    std::atomic<PeerState> state_;
    std::atomic<bool> closed_;
};

} // namespace websink

#endif // PEER_SESSION_H
