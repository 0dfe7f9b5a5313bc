/*
 * WebRTC Transport Module
 *
 * libdatachannel implementation of the peer transport: one
 * rtc::PeerConnection per browser, answering its offer with a send-only
 * video track. The track reuses the payload type the browser offered for
 * the codec and either packetizes the shared encoded stream or forwards
 * upstream RTP packets.
 */

#ifndef RTC_TRANSPORT_H
#define RTC_TRANSPORT_H

#include "../core/peer_transport.h"
#include <rtc/rtc.hpp>
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <condition_variable>

namespace webrtc {

// Map a libdatachannel connection state onto the session states
websink::PeerState map_state(rtc::PeerConnection::State state);

/**
 * One libdatachannel peer connection
 */
class RtcPeerTransport : public websink::PeerTransport {
public:
    RtcPeerTransport(const std::string& peer_id,
                     const websink::TrackInfo& track,
                     const websink::TransportConfig& config);
    ~RtcPeerTransport() override;

    RtcPeerTransport(const RtcPeerTransport&) = delete;
    RtcPeerTransport& operator=(const RtcPeerTransport&) = delete;

    void on_state_change(StateCallback callback) override;
    void set_remote_description(const websink::SessionDescription& offer) override;
    websink::SessionDescription create_answer() override;
    bool wait_gathering_complete(std::chrono::milliseconds timeout) override;
    websink::SessionDescription local_description() override;
    bool send_sample(const websink::EncodedSample& sample) override;
    void close() override;

private:
    // Add the send-only video track on the mid the browser offered
    void setup_video_track(const std::string& mid, int payload_type, const std::string& fmtp);

    // Packetizer chain for encoded input
    std::shared_ptr<rtc::MediaHandler> make_packetizer(int payload_type);

    bool send_rtp_packet(const std::shared_ptr<rtc::Track>& track, const websink::EncodedSample& sample);

    std::string id_;
    websink::TrackInfo track_info_;
    bool debug_;

    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<rtc::Track> video_track_;
    int payload_type_ = -1;

    // Cleared by close(); state changes after that are not reported
    std::shared_ptr<std::atomic<bool>> reporting_;

    std::mutex mutex_;
    std::condition_variable gathering_cv_;
    bool gathering_complete_ = false;
    bool closed_ = false;
};

/**
 * Creates RtcPeerTransports; initializes the libdatachannel logger once
 */
class RtcTransportBackend : public websink::TransportBackend {
public:
    explicit RtcTransportBackend(bool debug_connection = false);

    std::shared_ptr<websink::PeerTransport> create_transport(
        const std::string& peer_id,
        const websink::TrackInfo& track,
        const websink::TransportConfig& config
    ) override;
};

} // namespace webrtc

#endif // RTC_TRANSPORT_H
