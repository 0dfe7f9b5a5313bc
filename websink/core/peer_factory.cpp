/*
 * Peer Connection Factory
 */

#include "peer_factory.h"
#include "sink_errors.h"
#include <cstdio>

namespace websink {

PeerFactory::PeerFactory(TransportBackend& backend,
                         SessionRegistry& registry,
                         const DistributionTrack& track,
                         FactoryOptions options)
    : backend_(backend)
    , registry_(registry)
    , track_(track)
    , options_(std::move(options))
    , rng_(std::random_device{}())
{}

std::string PeerFactory::generate_uuid() {
    uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        hi = rng_();
        lo = rng_();
    }

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
             static_cast<unsigned>(hi >> 32),
             static_cast<unsigned>((hi >> 16) & 0xFFFF),
             static_cast<unsigned>(hi & 0xFFFF),
             static_cast<unsigned>(lo >> 48),
             static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

void PeerFactory::handle_state_change(SessionRegistry& registry,
                                      const std::weak_ptr<PeerSession>& weak_session,
                                      PeerState state,
                                      bool debug) {
    auto session = weak_session.lock();
    if (!session) {
        return;
    }

    session->set_state(state);
    if (debug) {
        fprintf(stderr, "[WebSink] Peer %s state: %s\n", session->id().c_str(), peer_state_name(state));
    }

    if (!is_terminal(state)) {
        return;
    }

    // Whoever gets the entry out of the registry closes it, exactly once
    auto removed = registry.remove(session->id());
    if (removed) {
        removed->close();
        fprintf(stderr, "[WebSink] Peer %s %s, removed (%zu remaining)\n",
                session->id().c_str(), peer_state_name(state), registry.count());
    }
}

void PeerFactory::rollback(const std::shared_ptr<PeerSession>& session) {
    auto removed = registry_.remove(session->id());
    if (removed) {
        removed->close();
    } else {
        session->close();
    }
}

Admission PeerFactory::admit(const SessionDescription& offer) {
    const std::string peer_id = id_generator_ ? id_generator_() : generate_uuid();
    const bool debug = options_.debug_connection;

    std::shared_ptr<PeerTransport> transport;
    try {
        transport = backend_.create_transport(peer_id, track_.info(), options_.transport);
    } catch (const std::exception& e) {
        throw NegotiationError("create peer connection", e.what());
    }
    if (!transport) {
        throw NegotiationError("create peer connection", "transport backend returned no connection");
    }
    if (debug) {
        fprintf(stderr, "[WebRTC] Created peer connection %s (%s)\n",
                peer_id.c_str(), track_.info().mime_type.c_str());
    }

    auto session = std::make_shared<PeerSession>(peer_id, transport);

    // Observer goes in before anything can change state
    SessionRegistry* registry = &registry_;
    std::weak_ptr<PeerSession> weak_session = session;
    transport->on_state_change([registry, weak_session, debug](PeerState state) {
        handle_state_change(*registry, weak_session, state, debug);
    });

    if (!registry_.insert(peer_id, session)) {
        session->close();
        throw DuplicateIdError(peer_id);
    }
    fprintf(stderr, "[WebSink] Added peer %s, total count: %zu\n", peer_id.c_str(), registry_.count());

    try {
        transport->set_remote_description(offer);
    } catch (const std::exception& e) {
        rollback(session);
        throw NegotiationError("set remote description", e.what());
    }
    if (debug) {
        fprintf(stderr, "[WebRTC] Set remote description for %s\n", peer_id.c_str());
    }

    try {
        SessionDescription answer = transport->create_answer();
        if (debug) {
            fprintf(stderr, "[WebRTC] Created %s for %s (sdp length=%zu)\n",
                    answer.type.c_str(), peer_id.c_str(), answer.sdp.size());
        }
    } catch (const std::exception& e) {
        rollback(session);
        throw NegotiationError("create answer", e.what());
    }

    bool gathered = false;
    try {
        gathered = transport->wait_gathering_complete(options_.gathering_timeout);
    } catch (const std::exception& e) {
        rollback(session);
        throw NegotiationError("ICE gathering", e.what());
    }
    if (!gathered) {
        rollback(session);
        throw NegotiationError("ICE gathering",
                               "timed out after " + std::to_string(options_.gathering_timeout.count()) + " ms");
    }
    if (debug) {
        fprintf(stderr, "[WebRTC] ICE gathering complete for %s\n", peer_id.c_str());
    }

    Admission admission;
    admission.peer_id = peer_id;
    admission.negotiated_codec = track_.info().mime_type;
    try {
        admission.answer = transport->local_description();
    } catch (const std::exception& e) {
        rollback(session);
        throw NegotiationError("local description", e.what());
    }
    if (admission.answer.sdp.empty()) {
        rollback(session);
        throw NegotiationError("local description", "no local description after gathering");
    }

    // The peer may already have failed while we were waiting
    PeerState state = session->state();
    if (is_terminal(state) || !registry_.contains(peer_id)) {
        rollback(session);
        throw NegotiationError("connection", std::string("peer went ") + peer_state_name(state) +
                               " during negotiation");
    }

    fprintf(stderr, "[WebSink] Session established with ID: %s using codec: %s\n",
            peer_id.c_str(), admission.negotiated_codec.c_str());
    return admission;
}

} // namespace websink
