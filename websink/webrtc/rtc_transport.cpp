/*
 * WebRTC Transport Implementation
 */

#include "rtc_transport.h"
#include <cstdio>
#include <stdexcept>
#include <variant>
#include <vector>

namespace webrtc {

// Transport whose state callback is running on this thread
static thread_local const RtcPeerTransport* t_reporting_transport = nullptr;

websink::PeerState map_state(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return websink::PeerState::New;
        case rtc::PeerConnection::State::Connecting: return websink::PeerState::Connecting;
        case rtc::PeerConnection::State::Connected: return websink::PeerState::Connected;
        case rtc::PeerConnection::State::Disconnected: return websink::PeerState::Disconnected;
        case rtc::PeerConnection::State::Failed: return websink::PeerState::Failed;
        case rtc::PeerConnection::State::Closed: return websink::PeerState::Closed;
    }
    return websink::PeerState::Failed;
}

RtcPeerTransport::RtcPeerTransport(const std::string& peer_id,
                                   const websink::TrackInfo& track,
                                   const websink::TransportConfig& config)
    : id_(peer_id)
    , track_info_(track)
    , debug_(config.debug_connection)
    , reporting_(std::make_shared<std::atomic<bool>>(true))
{
    rtc::Configuration rtc_config;
    for (const auto& server : config.ice_servers) {
        rtc_config.iceServers.emplace_back(server);
        if (debug_) {
            fprintf(stderr, "[WebRTC] Peer %s using ICE server: %s\n", id_.c_str(), server.c_str());
        }
    }
    // The answer is created explicitly once the video track is attached
    rtc_config.disableAutoNegotiation = true;

    pc_ = std::make_shared<rtc::PeerConnection>(rtc_config);

    pc_->onGatheringStateChange([this](rtc::PeerConnection::GatheringState state) {
        if (state == rtc::PeerConnection::GatheringState::Complete) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                gathering_complete_ = true;
            }
            gathering_cv_.notify_all();
            if (debug_) {
                fprintf(stderr, "[WebRTC] ICE gathering complete for %s\n", id_.c_str());
            }
        }
    });
}

RtcPeerTransport::~RtcPeerTransport() {
    try {
        close();
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Error closing %s: %s\n", id_.c_str(), e.what());
    }
}

void RtcPeerTransport::on_state_change(StateCallback callback) {
    std::string id = id_;
    bool debug = debug_;
    auto reporting = reporting_;
    const RtcPeerTransport* self = this;
    pc_->onStateChange([callback, id, debug, reporting, self](rtc::PeerConnection::State state) {
        if (!reporting->load()) {
            return;
        }
        websink::PeerState mapped = map_state(state);
        if (debug) {
            fprintf(stderr, "[WebRTC] Peer %s state: %s\n", id.c_str(), websink::peer_state_name(mapped));
        }
        if (callback) {
            // close() called from the callback must leave this functor alone
            const RtcPeerTransport* outer = t_reporting_transport;
            t_reporting_transport = self;
            callback(mapped);
            t_reporting_transport = outer;
        }
    });
}

std::shared_ptr<rtc::MediaHandler> RtcPeerTransport::make_packetizer(int payload_type) {
    // Upstream delivers byte-stream NAL units with 3 or 4 byte start codes
    std::shared_ptr<rtc::RtpPacketizationConfig> rtp_config;
    std::shared_ptr<rtc::MediaHandler> packetizer;
    switch (track_info_.codec) {
        case CodecType::H264:
            rtp_config = std::make_shared<rtc::RtpPacketizationConfig>(
                track_info_.ssrc, track_info_.track_id, static_cast<uint8_t>(payload_type), rtc::H264RtpPacketizer::ClockRate);
            packetizer = std::make_shared<rtc::H264RtpPacketizer>(
                rtc::H264RtpPacketizer::Separator::StartSequence, rtp_config);
            break;
        case CodecType::H265:
            rtp_config = std::make_shared<rtc::RtpPacketizationConfig>(
                track_info_.ssrc, track_info_.track_id, static_cast<uint8_t>(payload_type), rtc::H265RtpPacketizer::ClockRate);
            packetizer = std::make_shared<rtc::H265RtpPacketizer>(
                rtc::H265RtpPacketizer::Separator::StartSequence, rtp_config);
            break;
        case CodecType::AV1:
            rtp_config = std::make_shared<rtc::RtpPacketizationConfig>(
                track_info_.ssrc, track_info_.track_id, static_cast<uint8_t>(payload_type), rtc::AV1RtpPacketizer::ClockRate);
            packetizer = std::make_shared<rtc::AV1RtpPacketizer>(
                rtc::AV1RtpPacketizer::Packetization::TemporalUnit, rtp_config);
            break;
        case CodecType::VP8:
        case CodecType::VP9:
            throw std::runtime_error(std::string("no packetizer for ") + codec_name(track_info_.codec));
    }

    packetizer->addToChain(std::make_shared<rtc::RtcpSrReporter>(rtp_config));
    packetizer->addToChain(std::make_shared<rtc::RtcpNackResponder>());
    return packetizer;
}

void RtcPeerTransport::setup_video_track(const std::string& mid, int payload_type, const std::string& fmtp) {
    rtc::Description::Video media(mid, rtc::Description::Direction::SendOnly);
    switch (track_info_.codec) {
        case CodecType::H264:
            media.addH264Codec(payload_type, fmtp.empty()
                ? "profile-level-id=42e01f;packetization-mode=1;level-asymmetry-allowed=1" : fmtp);
            break;
        case CodecType::H265:
            media.addH265Codec(payload_type);
            break;
        case CodecType::AV1:
            media.addAV1Codec(payload_type);
            break;
        case CodecType::VP8:
            media.addVP8Codec(payload_type);
            break;
        case CodecType::VP9:
            media.addVP9Codec(payload_type);
            break;
    }
    media.addSSRC(track_info_.ssrc, track_info_.track_id, track_info_.stream_id, track_info_.track_id);

    // RTP input is already packetized and goes out through Track::send
    std::shared_ptr<rtc::MediaHandler> packetizer;
    if (track_info_.mode == StreamMode::Encoded) {
        packetizer = make_packetizer(payload_type);
    }

    auto track = pc_->addTrack(media);
    if (packetizer) {
        track->setMediaHandler(packetizer);
    }

    std::string id = id_;
    bool debug = debug_;
    track->onOpen([id, debug]() {
        if (debug) {
            fprintf(stderr, "[WebRTC] Video track OPEN for %s - ready to send frames!\n", id.c_str());
        }
    });

    track->onClosed([id, debug]() {
        if (debug) {
            fprintf(stderr, "[WebRTC] Video track CLOSED for %s\n", id.c_str());
        }
    });

    track->onError([id](std::string error) {
        fprintf(stderr, "[WebRTC] Video track ERROR for %s: %s\n", id.c_str(), error.c_str());
    });

    std::lock_guard<std::mutex> lock(mutex_);
    video_track_ = track;
    payload_type_ = payload_type;
}

void RtcPeerTransport::set_remote_description(const websink::SessionDescription& offer) {
    rtc::Description remote(offer.sdp, offer.type);

    // Answer on the browser's video m-line
    rtc::Description::Media* video = nullptr;
    for (int i = 0; i < remote.mediaCount(); i++) {
        auto entry = remote.media(i);
        if (auto* media = std::get_if<rtc::Description::Media*>(&entry)) {
            if ((*media)->type() == "video") {
                video = *media;
                break;
            }
        }
    }
    if (!video) {
        throw std::runtime_error("offer has no video media section");
    }

    // The answer must reuse the payload type the browser picked for the codec
    std::vector<OfferedPayload> offered;
    for (int pt : video->payloadTypes()) {
        const rtc::Description::Media::RtpMap* map = video->rtpMap(pt);
        if (map) {
            offered.push_back(OfferedPayload{pt, map->format, map->fmtps});
        }
    }
    int payload_type = select_payload_type(offered, track_info_.codec);
    if (payload_type < 0) {
        throw std::runtime_error(std::string("offer does not include ") + codec_rtp_name(track_info_.codec));
    }

    std::string fmtp;
    for (const auto& entry : offered) {
        if (entry.payload_type == payload_type && !entry.fmtps.empty()) {
            fmtp = entry.fmtps.front();
        }
    }

    std::string video_mid = video->mid();
    pc_->setRemoteDescription(remote);
    setup_video_track(video_mid, payload_type, fmtp);

    if (debug_) {
        fprintf(stderr, "[WebRTC] Remote description set for %s (video mid=%s, %s payload type %d)\n",
                id_.c_str(), video_mid.c_str(), codec_rtp_name(track_info_.codec), payload_type);
    }
}

websink::SessionDescription RtcPeerTransport::create_answer() {
    pc_->setLocalDescription(rtc::Description::Type::Answer);
    return local_description();
}

bool RtcPeerTransport::wait_gathering_complete(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto done = [this]() { return gathering_complete_ || closed_; };
    if (timeout.count() <= 0) {
        gathering_cv_.wait(lock, done);
        return gathering_complete_;
    }
    return gathering_cv_.wait_for(lock, timeout, done) && gathering_complete_;
}

websink::SessionDescription RtcPeerTransport::local_description() {
    auto description = pc_->localDescription();
    if (!description) {
        throw std::runtime_error("no local description");
    }
    return websink::SessionDescription{description->typeString(), std::string(*description)};
}

bool RtcPeerTransport::send_sample(const websink::EncodedSample& sample) {
    std::shared_ptr<rtc::Track> track;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        track = video_track_;
    }
    if (!track || !track->isOpen() || !sample.data) {
        return false;
    }

    if (track_info_.mode == StreamMode::Rtp) {
        return send_rtp_packet(track, sample);
    }

    rtc::FrameInfo frame_info(std::chrono::duration<double>(sample.timestamp));
    track->sendFrame(reinterpret_cast<const std::byte*>(sample.data->data()),
                     sample.data->size(),
                     frame_info);
    return true;
}

bool RtcPeerTransport::send_rtp_packet(const std::shared_ptr<rtc::Track>& track,
                                       const websink::EncodedSample& sample) {
    if (sample.size() < sizeof(rtc::RtpHeader)) {
        throw std::runtime_error("RTP packet shorter than its header");
    }

    int payload_type;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        payload_type = payload_type_;
    }

    // The buffer is shared by all peers; rewrite a private copy with this
    // peer's payload type and the SSRC announced in its answer
    const std::byte* begin = reinterpret_cast<const std::byte*>(sample.data->data());
    rtc::binary packet(begin, begin + sample.size());
    auto* header = reinterpret_cast<rtc::RtpHeader*>(packet.data());
    header->setPayloadType(static_cast<uint8_t>(payload_type));
    header->setSsrc(track_info_.ssrc);
    return track->send(std::move(packet));
}

void RtcPeerTransport::close() {
    std::shared_ptr<rtc::Track> track;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        track = video_track_;
    }
    reporting_->store(false);
    gathering_cv_.notify_all();

    // No callbacks into the session once it is being torn down. From inside
    // the state callback that functor is still running and must stay.
    if (t_reporting_transport == this) {
        pc_->onGatheringStateChange(nullptr);
    } else {
        pc_->resetCallbacks();
    }
    if (track) {
        track->resetCallbacks();
    }
    pc_->close();

    if (debug_) {
        fprintf(stderr, "[WebRTC] Peer %s closed\n", id_.c_str());
    }
}

RtcTransportBackend::RtcTransportBackend(bool debug_connection) {
    rtc::InitLogger(debug_connection ? rtc::LogLevel::Debug : rtc::LogLevel::Error);
    rtc::Preload();
}

std::shared_ptr<websink::PeerTransport> RtcTransportBackend::create_transport(
    const std::string& peer_id,
    const websink::TrackInfo& track,
    const websink::TransportConfig& config)
{
    return std::make_shared<RtcPeerTransport>(peer_id, track, config);
}

} // namespace webrtc
