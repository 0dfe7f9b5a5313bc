/*
 * Video Codec Description
 */

#include "codec.h"
#include <algorithm>
#include <cctype>
#include <strings.h>

static std::string to_lower(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

const char* codec_name(CodecType codec) {
    switch (codec) {
        case CodecType::H264: return "H.264";
        case CodecType::H265: return "H.265/HEVC";
        case CodecType::AV1:  return "AV1";
        case CodecType::VP8:  return "VP8";
        case CodecType::VP9:  return "VP9";
    }
    return "unknown";
}

const char* codec_mime_type(CodecType codec) {
    switch (codec) {
        case CodecType::H264: return "video/H264";
        case CodecType::H265: return "video/H265";
        case CodecType::AV1:  return "video/AV1";
        case CodecType::VP8:  return "video/VP8";
        case CodecType::VP9:  return "video/VP9";
    }
    return "video/unknown";
}

const char* codec_rtp_name(CodecType codec) {
    switch (codec) {
        case CodecType::H264: return "H264";
        case CodecType::H265: return "H265";
        case CodecType::AV1:  return "AV1";
        case CodecType::VP8:  return "VP8";
        case CodecType::VP9:  return "VP9";
    }
    return "unknown";
}

const char* stream_mode_name(StreamMode mode) {
    switch (mode) {
        case StreamMode::Encoded: return "encoded";
        case StreamMode::Rtp: return "rtp";
    }
    return "unknown";
}

bool parse_codec(const std::string& name, CodecType* out) {
    std::string lower = to_lower(name);

    if (lower == "h264" || lower == "h.264" || lower == "avc") {
        *out = CodecType::H264;
        return true;
    }
    if (lower == "h265" || lower == "h.265" || lower == "hevc") {
        *out = CodecType::H265;
        return true;
    }
    if (lower == "av1") {
        *out = CodecType::AV1;
        return true;
    }
    if (lower == "vp8") {
        *out = CodecType::VP8;
        return true;
    }
    if (lower == "vp9") {
        *out = CodecType::VP9;
        return true;
    }
    return false;
}

bool parse_stream_mode(const std::string& name, StreamMode* out) {
    std::string lower = to_lower(name);
    if (lower == "encoded") {
        *out = StreamMode::Encoded;
        return true;
    }
    if (lower == "rtp") {
        *out = StreamMode::Rtp;
        return true;
    }
    return false;
}

bool codec_supports_mode(CodecType codec, StreamMode mode) {
    if (mode == StreamMode::Rtp) {
        return true;
    }
    return codec == CodecType::H264 || codec == CodecType::H265 || codec == CodecType::AV1;
}

bool format_from_caps(const std::string& media_type, const std::string& encoding_name,
                      StreamFormat* out) {
    static const struct {
        const char* media_type;
        CodecType codec;
    } encoded[] = {
        {"video/x-h264", CodecType::H264},
        {"video/x-h265", CodecType::H265},
        {"video/x-av1",  CodecType::AV1},
        {"video/x-vp8",  CodecType::VP8},
        {"video/x-vp9",  CodecType::VP9},
    };

    for (const auto& entry : encoded) {
        if (media_type == entry.media_type) {
            *out = StreamFormat{entry.codec, StreamMode::Encoded};
            return true;
        }
    }

    if (media_type == "application/x-rtp") {
        CodecType codec;
        if (!parse_codec(encoding_name, &codec)) {
            return false;
        }
        *out = StreamFormat{codec, StreamMode::Rtp};
        return true;
    }
    return false;
}

int select_payload_type(const std::vector<OfferedPayload>& offered, CodecType codec) {
    const char* wanted = codec_rtp_name(codec);
    int fallback = -1;

    for (const auto& entry : offered) {
        if (strcasecmp(entry.format.c_str(), wanted) != 0) {
            continue;
        }
        if (codec != CodecType::H264) {
            return entry.payload_type;
        }

        for (const auto& fmtp : entry.fmtps) {
            if (fmtp.find("packetization-mode=1") != std::string::npos) {
                return entry.payload_type;
            }
        }
        if (fallback < 0) {
            fallback = entry.payload_type;
        }
    }
    return fallback;
}
