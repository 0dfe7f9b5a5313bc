/*
 * Sink Configuration Implementation
 */

#include "sink_config.h"
#include "../utils/json_utils.h"
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <strings.h>
#include <getopt.h>

namespace sink_config {

// Strict integer parse for option values
static bool parse_int(const char* text, int min_val, int max_val, int* out) {
    if (!text || !*text) return false;
    char* end = nullptr;
    long value = strtol(text, &end, 10);
    if (*end != '\0' || value < min_val || value > max_val) return false;
    *out = static_cast<int>(value);
    return true;
}

static bool env_flag(const char* name) {
    const char* value = getenv(name);
    if (!value) return false;
    return strcmp(value, "0") != 0 && strcasecmp(value, "false") != 0 && strcasecmp(value, "no") != 0;
}

bool SinkConfig::load(int argc, char* argv[]) {
    // The config file is applied first, so find it before the other flags
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file = argv[i + 1];
        } else if (strncmp(argv[i], "--config=", 9) == 0) {
            config_file = argv[i] + 9;
        }
    }

    if (!config_file.empty() && !load_from_file(config_file)) {
        return false;
    }

    load_from_env();
    if (!parse_command_line(argc, argv)) {
        return false;
    }
    return help_requested || validate();
}

bool SinkConfig::validate() const {
    if (!codec_supports_mode(codec, stream_mode)) {
        fprintf(stderr, "Config: %s needs RTP input (--rtp with an rtp payloader in the pipeline)\n",
                codec_name(codec));
        return false;
    }
    return true;
}

bool SinkConfig::parse_command_line(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"help",              no_argument,       0, 'h'},
        {"port",              required_argument, 0, 'p'},
        {"codec",             required_argument, 0, 'c'},
        {"live",              no_argument,       0, 'l'},
        {"rtp",               no_argument,       0,  0 },
        {"stun-server",       required_argument, 0,  0 },
        {"no-stun",           no_argument,       0,  0 },
        {"no-http",           no_argument,       0,  0 },
        {"gathering-timeout", required_argument, 0,  0 },
        {"flush-on-unlock",   no_argument,       0,  0 },
        {"pipeline",          required_argument, 0,  0 },
        {"config",            required_argument, 0,  0 },
        {"debug-connection",  no_argument,       0,  0 },
        {"debug-render",      no_argument,       0,  0 },
        {0, 0, 0, 0}
    };

    // Restart scanning (glibc), so the arguments can be parsed more than once
    optind = 0;
    opterr = 1;

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "hp:c:l", long_options, &option_index)) != -1) {
        switch (c) {
            case 0: {
                // Long option
                const char* name = long_options[option_index].name;
                if (strcmp(name, "rtp") == 0) {
                    stream_mode = StreamMode::Rtp;
                } else if (strcmp(name, "stun-server") == 0) {
                    stun_server = optarg;
                } else if (strcmp(name, "no-stun") == 0) {
                    stun_server.clear();
                } else if (strcmp(name, "no-http") == 0) {
                    serve_http = false;
                } else if (strcmp(name, "gathering-timeout") == 0) {
                    if (!parse_int(optarg, 0, 600000, &gathering_timeout_ms)) {
                        fprintf(stderr, "Config: Invalid gathering timeout: %s\n", optarg);
                        return false;
                    }
                } else if (strcmp(name, "flush-on-unlock") == 0) {
                    flush_on_unlock = true;
                } else if (strcmp(name, "pipeline") == 0) {
                    pipeline = optarg;
                } else if (strcmp(name, "config") == 0) {
                    config_file = optarg;
                } else if (strcmp(name, "debug-connection") == 0) {
                    debug_connection = true;
                } else if (strcmp(name, "debug-render") == 0) {
                    debug_render = true;
                }
                break;
            }

            case 'h':
                help_requested = true;
                return true;

            case 'p':
                if (!parse_int(optarg, 0, 65535, &port)) {
                    fprintf(stderr, "Config: Invalid port number: %s\n", optarg);
                    return false;
                }
                break;

            case 'c':
                if (!parse_codec(optarg, &codec)) {
                    fprintf(stderr, "Config: Unsupported codec: %s (h264, h265, av1, vp8, vp9)\n", optarg);
                    return false;
                }
                break;

            case 'l':
                is_live = true;
                break;

            case '?':
                // Error message already printed by getopt_long
                return false;

            default:
                fprintf(stderr, "Unknown option\n");
                return false;
        }
    }

    if (optind < argc) {
        fprintf(stderr, "Config: Unexpected argument: %s\n", argv[optind]);
        return false;
    }
    return true;
}

void SinkConfig::load_from_env() {
    if (env_flag("WEBSINK_DEBUG_CONNECTION")) {
        debug_connection = true;
    }
    if (env_flag("WEBSINK_DEBUG_RENDER")) {
        debug_render = true;
    }
    if (env_flag("WEBSINK_LIVE")) {
        is_live = true;
    }
}

bool SinkConfig::load_from_file(const std::string& path) {
    try {
        auto j = json_utils::parse_file(path);

        if (j.contains("sink")) {
            auto& sink = j["sink"];
            if (sink.contains("port")) {
                int value = json_utils::get_int(sink, "port", -1);
                if (value < 0 || value > 65535) {
                    fprintf(stderr, "Config: Invalid port in %s\n", path.c_str());
                    return false;
                }
                port = value;
            }
            if (sink.contains("http")) serve_http = json_utils::get_bool(sink, "http", serve_http);
            if (sink.contains("stun_server")) stun_server = json_utils::get_string(sink, "stun_server");
            if (sink.contains("codec")) {
                std::string name = json_utils::get_string(sink, "codec");
                if (!parse_codec(name, &codec)) {
                    fprintf(stderr, "Config: Unsupported codec in %s: %s\n", path.c_str(), name.c_str());
                    return false;
                }
            }
            if (sink.contains("stream_mode")) {
                std::string name = json_utils::get_string(sink, "stream_mode");
                if (!parse_stream_mode(name, &stream_mode)) {
                    fprintf(stderr, "Config: Invalid stream_mode in %s: %s\n", path.c_str(), name.c_str());
                    return false;
                }
            }
            if (sink.contains("is_live")) is_live = json_utils::get_bool(sink, "is_live", is_live);
            if (sink.contains("flush_on_unlock")) {
                flush_on_unlock = json_utils::get_bool(sink, "flush_on_unlock", flush_on_unlock);
            }
            if (sink.contains("gathering_timeout_ms")) {
                int value = json_utils::get_int(sink, "gathering_timeout_ms", -1);
                if (value < 0) {
                    fprintf(stderr, "Config: Invalid gathering_timeout_ms in %s\n", path.c_str());
                    return false;
                }
                gathering_timeout_ms = value;
            }
        }

        if (j.contains("source")) {
            auto& source = j["source"];
            if (source.contains("pipeline")) pipeline = json_utils::get_string(source, "pipeline", pipeline);
        }

        if (j.contains("debug")) {
            auto& debug = j["debug"];
            if (debug.contains("connection")) debug_connection = json_utils::get_bool(debug, "connection");
            if (debug.contains("render")) debug_render = json_utils::get_bool(debug, "render");
        }

        fprintf(stderr, "Config: Loaded from %s\n", path.c_str());

    } catch (const std::exception& e) {
        fprintf(stderr, "Config: Failed to load %s: %s\n", path.c_str(), e.what());
        return false;
    }

    return true;
}

websink::SinkSettings SinkConfig::to_settings() const {
    websink::SinkSettings settings;
    settings.port = port;
    settings.serve_http = serve_http;
    settings.stun_server = stun_server;
    settings.codec = codec;
    settings.stream_mode = stream_mode;
    settings.is_live = is_live;
    settings.flush_on_unlock = flush_on_unlock;
    settings.gathering_timeout = std::chrono::milliseconds(gathering_timeout_ms);
    settings.debug_connection = debug_connection;
    settings.debug_render = debug_render;
    return settings;
}

void SinkConfig::print_summary() const {
    fprintf(stderr, "\n=== websink WebRTC Server ===\n");
    if (serve_http) {
        fprintf(stderr, "Signaling:        http://0.0.0.0:%d/api/session%s\n",
                port, port == 0 ? " (any free port)" : "");
    } else {
        fprintf(stderr, "Signaling:        disabled\n");
    }
    fprintf(stderr, "STUN:             %s\n", stun_server.empty() ? "disabled" : stun_server.c_str());
    fprintf(stderr, "Codec:            %s (%s input)\n", codec_name(codec), stream_mode_name(stream_mode));
    fprintf(stderr, "Mode:             %s\n", is_live ? "live (drop without peers)" : "blocking (wait for peers)");
    fprintf(stderr, "Flush on unlock:  %s\n", flush_on_unlock ? "yes" : "no");
    if (gathering_timeout_ms > 0) {
        fprintf(stderr, "Gathering limit:  %d ms\n", gathering_timeout_ms);
    }
    fprintf(stderr, "Pipeline:         %s\n", pipeline.c_str());
    if (!config_file.empty()) {
        fprintf(stderr, "Config file:      %s\n", config_file.c_str());
    }

    // Show active debug flags
    if (debug_connection || debug_render) {
        fprintf(stderr, "\nDebug flags:\n");
        if (debug_connection) fprintf(stderr, "  - Connection (WebRTC/ICE/signaling)\n");
        if (debug_render)     fprintf(stderr, "  - Render (delivery/backpressure)\n");
    }

    fprintf(stderr, "\n");
}

void SinkConfig::print_usage(const char* program_name) const {
    fprintf(stderr, "Usage: %s [options]\n\n", program_name);
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  -h, --help                  Show this help\n");
    fprintf(stderr, "  -p, --port PORT             Signaling port, 0 = any (default: %d)\n", websink::DEFAULT_PORT);
    fprintf(stderr, "  -c, --codec NAME            h264, h265, av1, or vp8/vp9 with --rtp (default: h264)\n");
    fprintf(stderr, "      --rtp                   Pipeline ends in an RTP payloader; forward its packets\n");
    fprintf(stderr, "  -l, --live                  Drop samples while no peer is connected\n");
    fprintf(stderr, "      --stun-server URL       STUN server URL (default: %s)\n", websink::DEFAULT_STUN_SERVER);
    fprintf(stderr, "      --no-stun               Use no STUN server (localhost/LAN)\n");
    fprintf(stderr, "      --no-http               Do not serve the signaling endpoint\n");
    fprintf(stderr, "      --gathering-timeout MS  Limit ICE gathering per peer, 0 = none\n");
    fprintf(stderr, "      --flush-on-unlock       Deliver the pending sample on unlock if peers are present\n");
    fprintf(stderr, "      --pipeline DESC         GStreamer pipeline producing the encoded stream\n");
    fprintf(stderr, "      --config FILE           JSON config file\n");
    fprintf(stderr, "      --debug-connection      Enable WebRTC/ICE/signaling debug logs\n");
    fprintf(stderr, "      --debug-render          Enable per-sample delivery logs\n");
    fprintf(stderr, "\nEnvironment variables:\n");
    fprintf(stderr, "  WEBSINK_DEBUG_CONNECTION    Enable WebRTC/ICE/signaling debug logs\n");
    fprintf(stderr, "  WEBSINK_DEBUG_RENDER        Enable per-sample delivery logs\n");
    fprintf(stderr, "  WEBSINK_LIVE                Start in live mode\n");
    fprintf(stderr, "\n");
}

} // namespace sink_config
