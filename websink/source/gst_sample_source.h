/*
 * GStreamer Sample Source
 *
 * Runs a GStreamer pipeline that ends in encoded video and pulls its
 * samples from an appsink on a dedicated thread, handing each one to a
 * render callback (normally WebSink::render). The caps of the first
 * sample tell which codec and stream mode upstream produces; they are
 * handed to a format callback (normally WebSink::set_input_format) before
 * anything is rendered.
 *
 * The loop ends on stop(), end of stream, a pipeline error, caps that
 * cannot be carried or are refused, or when the render callback reports
 * RenderResult::Error.
 */

#ifndef GST_SAMPLE_SOURCE_H
#define GST_SAMPLE_SOURCE_H

#include "../core/web_sink.h"
#include <gst/gst.h>
#include <string>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>

namespace source {

class GstSampleSource {
public:
    using RenderFunction = std::function<websink::RenderResult(const uint8_t*, size_t, std::chrono::nanoseconds)>;
    using FormatFunction = std::function<bool(const StreamFormat&)>;

    // pipeline_desc: gst-launch description without the final appsink
    explicit GstSampleSource(std::string pipeline_desc);
    ~GstSampleSource();

    GstSampleSource(const GstSampleSource&) = delete;
    GstSampleSource& operator=(const GstSampleSource&) = delete;

    bool start(FormatFunction on_format, RenderFunction render);
    void stop();

    // False once the pull loop has exited, on stop() or on its own
    bool is_running() const { return running_.load(); }

private:
    void run();

    // Drain pending bus messages; false on error or end of stream
    bool check_bus();

    // Map the sample caps and pass them to the format callback
    bool check_format(GstSample* sample);

    void release();

    std::string pipeline_desc_;
    FormatFunction on_format_;
    RenderFunction render_;

    GstElement* pipeline_ = nullptr;
    GstElement* appsink_ = nullptr;
    GstBus* bus_ = nullptr;

    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace source

#endif // GST_SAMPLE_SOURCE_H
