/*
 * WebSink Element Implementation
 */

#include "web_sink.h"
#include "sink_errors.h"
#include "../utils/net_utils.h"
#include <cstdio>
#include <random>

namespace websink {

const char* render_result_name(RenderResult result) {
    switch (result) {
        case RenderResult::Delivered: return "delivered";
        case RenderResult::Dropped: return "dropped";
        case RenderResult::Unblocked: return "unblocked";
        case RenderResult::Error: return "error";
    }
    return "unknown";
}

WebSink::WebSink(std::shared_ptr<TransportBackend> backend)
    : backend_(std::move(backend))
    , registry_(signal_)
    , gate_(registry_, signal_)
    , started_(false)
    , format_rejected_(false)
{}

WebSink::~WebSink() {
    if (started_) {
        deactivate();
    }
}

// Settings

bool WebSink::set_settings(const SinkSettings& settings) {
    if (settings.port < 0 || settings.port > 65535) {
        fprintf(stderr, "[WebSink] Invalid port number: %d\n", settings.port);
        return false;
    }
    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (started_) {
        fprintf(stderr, "[WebSink] Cannot change settings while running\n");
        return false;
    }
    std::lock_guard<std::mutex> lock(settings_mutex_);
    settings_ = settings;
    return true;
}

SinkSettings WebSink::settings() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return settings_;
}

bool WebSink::set_port(int port) {
    SinkSettings s = settings();
    s.port = port;
    return set_settings(s);
}

bool WebSink::set_stun_server(const std::string& stun_server) {
    SinkSettings s = settings();
    s.stun_server = stun_server;
    return set_settings(s);
}

bool WebSink::set_live(bool live) {
    SinkSettings s = settings();
    s.is_live = live;
    return set_settings(s);
}

bool WebSink::set_codec(CodecType codec) {
    SinkSettings s = settings();
    s.codec = codec;
    return set_settings(s);
}

bool WebSink::set_stream_mode(StreamMode mode) {
    SinkSettings s = settings();
    s.stream_mode = mode;
    return set_settings(s);
}

bool WebSink::set_gathering_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() < 0) {
        fprintf(stderr, "[WebSink] Invalid gathering timeout: %lld ms\n",
                static_cast<long long>(timeout.count()));
        return false;
    }
    SinkSettings s = settings();
    s.gathering_timeout = timeout;
    return set_settings(s);
}

bool WebSink::set_flush_on_unlock(bool flush) {
    SinkSettings s = settings();
    s.flush_on_unlock = flush;
    return set_settings(s);
}

bool WebSink::set_serve_http(bool serve) {
    SinkSettings s = settings();
    s.serve_http = serve;
    return set_settings(s);
}

void WebSink::set_id_generator(PeerFactory::IdGenerator generator) {
    std::unique_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    id_generator_ = std::move(generator);
    if (factory_ && id_generator_) {
        factory_->set_id_generator(id_generator_);
    }
}

// Lifecycle

bool WebSink::activate() {
    std::lock_guard<std::mutex> control(control_mutex_);
    std::unique_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (started_) {
        fprintf(stderr, "[WebSink] Already started\n");
        return false;
    }

    SinkSettings s = settings();
    if (!codec_supports_mode(s.codec, s.stream_mode)) {
        fprintf(stderr, "[WebSink] %s can only be streamed from RTP input\n", codec_name(s.codec));
        return false;
    }

    format_rejected_ = false;
    gate_.unlock_stop();
    gate_.configure(s.is_live, s.flush_on_unlock);

    std::random_device rd;
    TrackInfo info;
    info.codec = s.codec;
    info.mode = s.stream_mode;
    info.mime_type = codec_mime_type(s.codec);
    info.ssrc = std::uniform_int_distribution<uint32_t>(1, 0xFFFFFFFFu)(rd);
    track_ = std::make_unique<DistributionTrack>(registry_, info, s.debug_render);

    FactoryOptions options;
    if (!s.stun_server.empty()) {
        options.transport.ice_servers.push_back(s.stun_server);
    }
    options.transport.debug_connection = s.debug_connection;
    options.gathering_timeout = s.gathering_timeout;
    options.debug_connection = s.debug_connection;
    factory_ = std::make_unique<PeerFactory>(*backend_, registry_, *track_, options);
    if (id_generator_) {
        factory_->set_id_generator(id_generator_);
    }

    // Admissions wait on the lifecycle lock until activation is done
    started_ = true;

    if (s.serve_http && !start_http()) {
        started_ = false;
        factory_.reset();
        track_.reset();
        return false;
    }

    fprintf(stderr, "[WebSink] Started (%s %s, %s mode)\n",
            codec_name(s.codec), stream_mode_name(s.stream_mode), s.is_live ? "live" : "blocking");
    return true;
}

bool WebSink::deactivate() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (!started_) {
        fprintf(stderr, "[WebSink] Not started\n");
        return false;
    }

    // Wake a producer waiting for peers before anything else
    gate_.unlock();

    // No new requests; in-flight admissions finish first
    http_server_.stop();

    std::unique_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    started_ = false;

    auto sessions = registry_.drain();
    for (auto& session : sessions) {
        session->close();
    }
    if (!sessions.empty()) {
        fprintf(stderr, "[WebSink] Closed %zu peer connection(s)\n", sessions.size());
    }

    factory_.reset();
    track_.reset();
    session_handler_.reset();

    fprintf(stderr, "[WebSink] Stopped\n");
    return true;
}

bool WebSink::start_http() {
    SinkSettings s = settings();

    int port = net_utils::find_available_port(s.port);
    if (port < 0) {
        fprintf(stderr, "[WebSink] Could not find available port: none free between %d and %d\n",
                s.port, s.port + net_utils::PORT_SEARCH_RANGE - 1);
        return false;
    }

    session_handler_ = std::make_unique<http::SessionHandler>(
        [this](const SessionDescription& offer) { return admit(offer); },
        s.debug_connection);

    http::SessionHandler* handler = session_handler_.get();
    if (!http_server_.start(port, [handler](const http::Request& req) { return handler->handle(req); })) {
        session_handler_.reset();
        return false;
    }

    print_urls(http_server_.port());
    return true;
}

void WebSink::print_urls(int port) const {
    std::string host = net_utils::host_name();
    std::string ip = net_utils::external_ip();
    fprintf(stderr, "\033[32mHTTP server started at http://%s.local:%d and http://%s:%d\033[0m\n",
            host.c_str(), port, ip.c_str(), port);
}

int WebSink::bound_port() const {
    return http_server_.is_running() ? http_server_.port() : 0;
}

uint64_t WebSink::samples_written() const {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    return track_ ? track_->samples_written() : 0;
}

// Data path

RenderResult WebSink::render(const uint8_t* data, size_t size, std::chrono::nanoseconds duration) {
    if (!started_) {
        fprintf(stderr, "[WebSink] Render while stopped: no track to write to\n");
        return RenderResult::Error;
    }

    if (format_rejected_) {
        return RenderResult::Error;
    }

    const bool debug = settings().debug_render;

    GateDecision decision = gate_.admit();
    if (decision == GateDecision::Drop) {
        if (debug) {
            fprintf(stderr, "[WebSink] No peers, dropping %zu byte sample (live)\n", size);
        }
        return RenderResult::Dropped;
    }
    if (decision == GateDecision::Shutdown) {
        if (debug) {
            fprintf(stderr, "[WebSink] Unblocked while waiting for peers\n");
        }
        return RenderResult::Unblocked;
    }

    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (!track_) {
        // Stopped between the gate and here
        if (gate_.is_unlocked()) {
            return RenderResult::Unblocked;
        }
        fprintf(stderr, "[WebSink] Render while stopped: no track to write to\n");
        return RenderResult::Error;
    }

    DeliveryStats stats = track_->write_sample(data, size, duration);
    if (debug) {
        fprintf(stderr, "[WebSink] Sample %zu bytes: %zu delivered, %zu skipped, %zu failed\n",
                size, stats.delivered, stats.skipped, stats.failed);
    }
    return RenderResult::Delivered;
}

bool WebSink::set_input_format(const StreamFormat& format) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (!started_ || !track_) {
        fprintf(stderr, "[WebSink] Input format while stopped\n");
        return false;
    }

    const TrackInfo& info = track_->info();
    StreamFormat expected{info.codec, info.mode};
    if (format != expected) {
        fprintf(stderr, "[WebSink] Input is %s %s but the track carries %s %s\n",
                codec_name(format.codec), stream_mode_name(format.mode),
                codec_name(expected.codec), stream_mode_name(expected.mode));
        format_rejected_ = true;
        return false;
    }

    if (settings().debug_render) {
        fprintf(stderr, "[WebSink] Input format %s %s\n", codec_name(format.codec), stream_mode_name(format.mode));
    }
    return true;
}

Admission WebSink::admit(const SessionDescription& offer) {
    // Held for the whole handshake so deactivate() cannot drain underneath
    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (!started_ || !factory_) {
        throw NotStartedError();
    }
    return factory_->admit(offer);
}

void WebSink::unlock() {
    gate_.unlock();
}

void WebSink::unlock_stop() {
    gate_.unlock_stop();
}

} // namespace websink
