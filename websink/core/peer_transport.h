/*
 * Peer Transport Interface
 *
 * Boundary to the external negotiation capability. The core never looks
 * at SDP or RTP itself; it drives a PeerTransport through the offer/answer
 * steps and hands it encoded samples.
 *
 * The libdatachannel implementation lives in webrtc/rtc_transport.h.
 */

#ifndef PEER_TRANSPORT_H
#define PEER_TRANSPORT_H

#include "../codec.h"
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>
#include <cstdint>

namespace websink {

enum class PeerState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

const char* peer_state_name(PeerState state);

// Disconnected, Failed and Closed end a session
inline bool is_terminal(PeerState state) {
    return state == PeerState::Disconnected ||
           state == PeerState::Failed ||
           state == PeerState::Closed;
}

/**
 * Session description as exchanged with the browser
 */
struct SessionDescription {
    std::string type;   // "offer" or "answer"
    std::string sdp;
};

/**
 * Properties of the shared outbound track every transport attaches to
 */
struct TrackInfo {
    CodecType codec = CodecType::H264;
    StreamMode mode = StreamMode::Encoded;
    std::string mime_type;
    uint32_t ssrc = 0;
    std::string stream_id = "websink";
    std::string track_id = "video";
};

/**
 * Transport-level settings shared by all peers of one element
 */
struct TransportConfig {
    std::vector<std::string> ice_servers;   // e.g. "stun:stun.l.google.com:19302"
    bool debug_connection = false;
};

/**
 * One negotiated realtime connection to a browser
 *
 * Negotiation methods throw std::exception subclasses on failure.
 * Callbacks may fire on transport-owned threads, and the state callback
 * may close its own transport.
 */
class PeerTransport {
public:
    using StateCallback = std::function<void(PeerState)>;

    virtual ~PeerTransport() = default;

    // Must be called before the remote description is applied
    virtual void on_state_change(StateCallback callback) = 0;

    virtual void set_remote_description(const SessionDescription& offer) = 0;

    // Create the local answer and apply it as local description
    virtual SessionDescription create_answer() = 0;

    /**
     * Block until ICE gathering is complete
     * @param timeout Maximum wait, zero waits without a deadline
     * @return false if the timeout expired first
     */
    virtual bool wait_gathering_complete(std::chrono::milliseconds timeout) = 0;

    // Final local description (includes gathered candidates)
    virtual SessionDescription local_description() = 0;

    /**
     * Send one encoded sample (one RTP packet in RTP mode)
     * @return false if the transport is not ready to carry media yet
     * @throws std::exception if the transport rejects the sample
     */
    virtual bool send_sample(const EncodedSample& sample) = 0;

    // Release the connection; further calls to send_sample must be harmless.
    // Safe to call from inside the state callback; no state change is
    // reported after it returns.
    virtual void close() = 0;
};

/**
 * Creates PeerTransports bound to the shared track
 */
class TransportBackend {
public:
    virtual ~TransportBackend() = default;

    virtual std::shared_ptr<PeerTransport> create_transport(
        const std::string& peer_id,
        const TrackInfo& track,
        const TransportConfig& config
    ) = 0;
};

} // namespace websink

#endif // PEER_TRANSPORT_H
