/*
 * Sink Configuration
 *
 * Settings for the websink server: defaults, an optional JSON file,
 * WEBSINK_* environment variables and the command line, applied in that
 * order so later sources win.
 */

#ifndef SINK_CONFIG_H
#define SINK_CONFIG_H

#include "../core/web_sink.h"
#include <string>

namespace sink_config {

constexpr const char* DEFAULT_PIPELINE =
    "videotestsrc is-live=true ! videoconvert ! x264enc tune=zerolatency key-int-max=30 ! "
    "video/x-h264,stream-format=byte-stream,alignment=au";

struct SinkConfig {
    // Signaling
    int port = websink::DEFAULT_PORT;
    bool serve_http = true;
    std::string stun_server = websink::DEFAULT_STUN_SERVER;

    // Stream
    CodecType codec = CodecType::H264;
    StreamMode stream_mode = StreamMode::Encoded;
    bool is_live = false;
    bool flush_on_unlock = false;
    int gathering_timeout_ms = 0;

    // Source
    std::string pipeline = DEFAULT_PIPELINE;
    std::string config_file;

    // Debug flags
    bool debug_connection = false;   // WebRTC, ICE, signaling logs
    bool debug_render = false;       // Per-sample delivery and backpressure logs

    bool help_requested = false;

    /**
     * Full load: JSON file named by --config, then environment, then flags
     * @return false on an invalid option, an unreadable config file or a
     *         combination validate() rejects
     */
    bool load(int argc, char* argv[]);

    // Cross-field checks once every source has been applied
    bool validate() const;

    /**
     * Parse command-line arguments
     * @return false on an unknown option or invalid value
     */
    bool parse_command_line(int argc, char* argv[]);

    /**
     * Load configuration from environment variables
     * Checks WEBSINK_DEBUG_CONNECTION, WEBSINK_DEBUG_RENDER, WEBSINK_LIVE
     */
    void load_from_env();

    /**
     * Load configuration from a JSON file
     *
     * {"sink": {"port", "http", "stun_server", "codec", "stream_mode",
     *           "is_live", "flush_on_unlock", "gathering_timeout_ms"},
     *  "source": {"pipeline"},
     *  "debug": {"connection", "render"}}
     *
     * Missing keys keep their current value.
     */
    bool load_from_file(const std::string& path);

    // Element properties for these settings
    websink::SinkSettings to_settings() const;

    void print_summary() const;
    void print_usage(const char* program_name) const;
};

} // namespace sink_config

#endif // SINK_CONFIG_H
