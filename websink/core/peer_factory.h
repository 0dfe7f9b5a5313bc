/*
 * Peer Connection Factory
 *
 * Admits one browser peer: builds its transport on the shared track,
 * hooks the state observer, registers it and runs the offer/answer
 * exchange. A failed admission never leaves a registry entry behind.
 */

#ifndef PEER_FACTORY_H
#define PEER_FACTORY_H

#include "peer_transport.h"
#include "peer_session.h"
#include "session_registry.h"
#include "distribution_track.h"
#include <string>
#include <memory>
#include <mutex>
#include <random>
#include <chrono>
#include <functional>

namespace websink {

/**
 * Result of a successful admission
 */
struct Admission {
    std::string peer_id;
    SessionDescription answer;
    std::string negotiated_codec;   // mime type of the shared track
};

struct FactoryOptions {
    TransportConfig transport;
    std::chrono::milliseconds gathering_timeout{0};   // 0 = no deadline at this layer
    bool debug_connection = false;
};

class PeerFactory {
public:
    using IdGenerator = std::function<std::string()>;

    PeerFactory(TransportBackend& backend,
                SessionRegistry& registry,
                const DistributionTrack& track,
                FactoryOptions options);

    /**
     * Run the full admission handshake for one offer
     * @throws DuplicateIdError if the allocated id is already registered
     * @throws NegotiationError if any negotiation step fails
     */
    Admission admit(const SessionDescription& offer);

    // Replace the id allocator (UUID v4 by default)
    void set_id_generator(IdGenerator generator) { id_generator_ = std::move(generator); }

    /**
     * Connection-state observer body
     *
     * Records the state and, on Disconnected/Failed/Closed, removes the peer
     * and closes its transport. Safe against duplicate notifications: only the
     * caller that wins the registry removal closes.
     */
    static void handle_state_change(SessionRegistry& registry,
                                    const std::weak_ptr<PeerSession>& weak_session,
                                    PeerState state,
                                    bool debug);

private:
    std::string generate_uuid();

    // Remove the entry (if still registered) and close the session
    void rollback(const std::shared_ptr<PeerSession>& session);

    TransportBackend& backend_;
    SessionRegistry& registry_;
    const DistributionTrack& track_;
    FactoryOptions options_;
    IdGenerator id_generator_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace websink

#endif // PEER_FACTORY_H
