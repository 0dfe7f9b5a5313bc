/*
 * websink server
 *
 * Streams one encoded video pipeline to any number of browsers over
 * WebRTC. Browsers POST their offer to /api/session and get an answer back;
 * every encoded sample is fanned out to all connected peers.
 */

#include "config/sink_config.h"
#include "core/web_sink.h"
#include "webrtc/rtc_transport.h"
#include "source/gst_sample_source.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <memory>
#include <csignal>
#include <cstdio>

static std::atomic<bool> g_running(true);

// Signal handler for graceful shutdown
static void signal_handler(int sig) {
    (void)sig;
    g_running = false;
}

int main(int argc, char* argv[]) {
    // Parse configuration from config file, environment and command line
    sink_config::SinkConfig config;
    if (!config.load(argc, argv)) {
        config.print_usage(argv[0]);
        return 1;
    }
    if (config.help_requested) {
        config.print_usage(argv[0]);
        return 0;
    }

    // Set up signal handlers for graceful shutdown
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    config.print_summary();

    auto backend = std::make_shared<webrtc::RtcTransportBackend>(config.debug_connection);
    websink::WebSink sink(backend);
    if (!sink.set_settings(config.to_settings())) {
        fprintf(stderr, "Server: Invalid settings\n");
        return 1;
    }

    if (!sink.activate()) {
        fprintf(stderr, "Server: Failed to start websink\n");
        return 1;
    }

    source::GstSampleSource source(config.pipeline);
    bool started = source.start(
        [&sink](const StreamFormat& format) {
            return sink.set_input_format(format);
        },
        [&sink](const uint8_t* data, size_t size, std::chrono::nanoseconds duration) {
            return sink.render(data, size, duration);
        });
    if (!started) {
        fprintf(stderr, "Server: Failed to start pipeline\n");
        sink.deactivate();
        return 1;
    }

    fprintf(stderr, "Server: Running (Ctrl+C to stop)\n");

    auto last_report = std::chrono::steady_clock::now();
    size_t last_peers = 0;
    while (g_running && source.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        size_t peers = sink.peer_count();
        auto now = std::chrono::steady_clock::now();
        if (peers != last_peers || (config.debug_render && now - last_report >= std::chrono::seconds(5))) {
            fprintf(stderr, "Server: %zu peer(s) connected, %llu samples written\n",
                    peers, static_cast<unsigned long long>(sink.samples_written()));
            last_peers = peers;
            last_report = now;
        }
    }

    if (!g_running) {
        fprintf(stderr, "\nServer: Received signal, shutting down...\n");
    }

    // Release the producer first if it is waiting for peers
    sink.deactivate();
    source.stop();

    fprintf(stderr, "Server: Shutdown complete\n");
    return 0;
}
