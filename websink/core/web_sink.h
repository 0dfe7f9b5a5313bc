/*
 * WebSink Element
 *
 * Stopped/started state machine owning the whole fan-out engine: session
 * registry, render gate, distribution track, peer factory and (optionally)
 * the HTTP signaling server.
 *
 * Threads:
 * - producer thread: render()
 * - HTTP worker threads: admit()
 * - transport threads: state observers
 * - control thread: activate()/deactivate()/unlock()
 */

#ifndef WEB_SINK_H
#define WEB_SINK_H

#include "peer_transport.h"
#include "session_registry.h"
#include "unblock_signal.h"
#include "render_gate.h"
#include "distribution_track.h"
#include "peer_factory.h"
#include "../http/http_server.h"
#include "../http/session_handler.h"
#include <string>
#include <memory>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <chrono>

namespace websink {

constexpr int DEFAULT_PORT = 8091;
constexpr const char* DEFAULT_STUN_SERVER = "stun:stun.l.google.com:19302";

/**
 * Element properties, fixed while started
 */
struct SinkSettings {
    int port = DEFAULT_PORT;                          // 0 = any free port
    std::string stun_server = DEFAULT_STUN_SERVER;    // Empty = no ICE server
    bool is_live = false;
    CodecType codec = CodecType::H264;
    StreamMode stream_mode = StreamMode::Encoded;
    std::chrono::milliseconds gathering_timeout{0};   // 0 = no deadline
    bool flush_on_unlock = false;
    bool serve_http = true;
    bool debug_connection = false;
    bool debug_render = false;
};

enum class RenderResult {
    Delivered,  // Handed to the track (peers may still have skipped it)
    Dropped,    // Live mode with no peers
    Unblocked,  // Force-unblocked while waiting for peers, not an error
    Error       // Not started or input format rejected; the producer must stop
};

const char* render_result_name(RenderResult result);

class WebSink {
public:
    explicit WebSink(std::shared_ptr<TransportBackend> backend);
    ~WebSink();

    WebSink(const WebSink&) = delete;
    WebSink& operator=(const WebSink&) = delete;

    // Property setters; all return false (and change nothing) while started
    bool set_settings(const SinkSettings& settings);
    bool set_port(int port);
    bool set_stun_server(const std::string& stun_server);
    bool set_live(bool live);
    bool set_codec(CodecType codec);
    bool set_stream_mode(StreamMode mode);
    bool set_gathering_timeout(std::chrono::milliseconds timeout);
    bool set_flush_on_unlock(bool flush);
    bool set_serve_http(bool serve);

    SinkSettings settings() const;

    /**
     * Start the element
     * @return false if already started, the codec cannot be carried in the
     *         configured stream mode, or the HTTP server cannot be bound
     */
    bool activate();

    /**
     * Stop the element: wake the producer, stop signaling, close every peer
     * @return false if not started
     */
    bool deactivate();

    bool is_started() const { return started_.load(); }

    /**
     * Deliver one encoded sample to all peers
     * Called from the producer thread only. May block in non-live mode
     * while there are no peers.
     */
    RenderResult render(const uint8_t* data, size_t size, std::chrono::nanoseconds duration);

    /**
     * Check the format upstream actually produces against the configured
     * codec and stream mode. On a mismatch every following render()
     * returns Error until the next activate().
     * @return false on a mismatch or when not started
     */
    bool set_input_format(const StreamFormat& format);

    /**
     * Admit one browser peer
     * @throws NotStartedError, DuplicateIdError, NegotiationError
     */
    Admission admit(const SessionDescription& offer);

    // Wake a blocked render() without stopping
    void unlock();

    // Allow render() to block again
    void unlock_stop();

    size_t peer_count() const { return registry_.count(); }

    // Port the signaling server is bound to, 0 when not serving
    int bound_port() const;

    SessionRegistry& registry() { return registry_; }
    const RenderGate& gate() const { return gate_; }

    // Samples handed to the current track (0 when stopped)
    uint64_t samples_written() const;

    // Replace the peer id allocator of factories created by activate()
    void set_id_generator(PeerFactory::IdGenerator generator);

private:
    bool start_http();
    void print_urls(int port) const;

    std::shared_ptr<TransportBackend> backend_;

    UnblockSignal signal_;
    SessionRegistry registry_;
    RenderGate gate_;

    mutable std::mutex settings_mutex_;
    SinkSettings settings_;

    // Serializes activate/deactivate
    std::mutex control_mutex_;

    // Exclusive for activate/deactivate, shared for render and admit
    mutable std::shared_mutex lifecycle_mutex_;
    std::atomic<bool> started_;
    std::atomic<bool> format_rejected_;
    std::unique_ptr<DistributionTrack> track_;
    std::unique_ptr<PeerFactory> factory_;
    PeerFactory::IdGenerator id_generator_;

    std::unique_ptr<http::SessionHandler> session_handler_;
    http::Server http_server_;
};

} // namespace websink

#endif // WEB_SINK_H
