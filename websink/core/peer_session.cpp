/*
 * Peer Session
 */

#include "peer_session.h"
#include <cstdio>

namespace websink {

const char* peer_state_name(PeerState state) {
    switch (state) {
        case PeerState::New: return "New";
        case PeerState::Connecting: return "Connecting";
        case PeerState::Connected: return "Connected";
        case PeerState::Disconnected: return "Disconnected";
        case PeerState::Failed: return "Failed";
        case PeerState::Closed: return "Closed";
    }
    return "unknown";
}

PeerSession::PeerSession(std::string id, std::shared_ptr<PeerTransport> transport)
    : id_(std::move(id))
    , transport_(std::move(transport))
    , state_(PeerState::New)
    , closed_(false)
{}

PeerSession::~PeerSession() {
    close();
}

bool PeerSession::deliver(const EncodedSample& sample) {
    if (closed_.load() || !transport_) {
        return false;
    }

    return transport_->send_sample(sample);
}

bool PeerSession::close() {
    if (closed_.exchange(true)) {
        return false;
    }

    if (transport_) {
        try {
            transport_->close();
        } catch (const std::exception& e) {
            fprintf(stderr, "[WebSink] Error closing peer %s: %s\n", id_.c_str(), e.what());
        }
    }
    return true;
}

} // namespace websink
