/*
 * Video Codec Description
 *
 * The encoded stream is produced upstream; websink only needs to know
 * which codec it carries so each peer gets the matching SDP and RTP
 * packetizer:
 * - H.264 (byte-stream, access-unit aligned)
 * - H.265/HEVC (byte-stream, access-unit aligned)
 * - AV1 (temporal units)
 *
 * Upstream may also hand over ready-made RTP packets (rtph264pay,
 * rtpvp8pay, ...). Those are forwarded as-is, which is the only way
 * VP8 and VP9 can be carried.
 */

#ifndef CODEC_H
#define CODEC_H

#include <vector>
#include <string>
#include <memory>
#include <chrono>
#include <cstdint>

enum class CodecType {
    H264,
    H265,
    AV1,
    VP8,
    VP9
};

enum class StreamMode {
    Encoded,    // Elementary stream, packetized per peer
    Rtp         // RTP packets from upstream, forwarded unchanged
};

// Default sample duration when the producer does not provide one (30 fps)
constexpr std::chrono::nanoseconds DEFAULT_SAMPLE_DURATION{33333333};

/**
 * One encoded media chunk as handed to every peer.
 *
 * The payload is shared and immutable: the same buffer reaches all peers.
 * In RTP mode each sample is one RTP packet.
 */
struct EncodedSample {
    std::shared_ptr<const std::vector<uint8_t>> data;
    std::chrono::nanoseconds duration{DEFAULT_SAMPLE_DURATION};
    std::chrono::nanoseconds timestamp{0};   // Presentation time since the track was created
    uint64_t sequence = 0;                   // Write order on the track

    size_t size() const { return data ? data->size() : 0; }
};

// What the upstream pipeline actually produces
struct StreamFormat {
    CodecType codec = CodecType::H264;
    StreamMode mode = StreamMode::Encoded;

    bool operator==(const StreamFormat& other) const {
        return codec == other.codec && mode == other.mode;
    }
    bool operator!=(const StreamFormat& other) const { return !(*this == other); }
};

// Human readable codec name ("H.264")
const char* codec_name(CodecType codec);

// WebRTC mime type ("video/H264")
const char* codec_mime_type(CodecType codec);

// RTP encoding name as used in SDP rtpmap lines and RTP caps ("H264")
const char* codec_rtp_name(CodecType codec);

const char* stream_mode_name(StreamMode mode);

/**
 * Parse a codec name as used on the command line and in config files
 * @param name "h264", "h265"/"hevc", "av1", "vp8", "vp9" (case insensitive)
 * @param out Parsed codec
 * @return false if the name is not a known codec
 */
bool parse_codec(const std::string& name, CodecType* out);

// "encoded" or "rtp"
bool parse_stream_mode(const std::string& name, StreamMode* out);

// VP8 and VP9 have no packetizer, so they are only accepted as RTP input
bool codec_supports_mode(CodecType codec, StreamMode mode);

/**
 * Map the caps of the first upstream sample to a stream format
 * @param media_type Caps structure name ("video/x-h264", "application/x-rtp")
 * @param encoding_name The "encoding-name" field for RTP caps, else empty
 * @return false for caps websink cannot carry
 */
bool format_from_caps(const std::string& media_type, const std::string& encoding_name,
                      StreamFormat* out);

/**
 * One rtpmap entry of an offered video section
 */
struct OfferedPayload {
    int payload_type = -1;
    std::string format;                 // "H264", "VP8", ...
    std::vector<std::string> fmtps;     // "profile-level-id=42e01f;packetization-mode=1"
};

/**
 * Pick the payload type the browser assigned to a codec.
 * For H.264 an entry with packetization-mode=1 wins, since the packetizer
 * emits fragmentation units.
 * @return the payload type, or -1 if the codec was not offered
 */
int select_payload_type(const std::vector<OfferedPayload>& offered, CodecType codec);

#endif // CODEC_H
