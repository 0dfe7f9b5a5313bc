/*
 * GStreamer Sample Source Implementation
 */

#include "gst_sample_source.h"
#include <gst/app/gstappsink.h>
#include <cstdio>

namespace source {

GstSampleSource::GstSampleSource(std::string pipeline_desc)
    : pipeline_desc_(std::move(pipeline_desc))
{}

GstSampleSource::~GstSampleSource() {
    stop();
}

bool GstSampleSource::start(FormatFunction on_format, RenderFunction render) {
    if (running_ || thread_.joinable()) {
        fprintf(stderr, "GStreamer: Source already started\n");
        return false;
    }

    // Initialize GStreamer
    GError* error = nullptr;
    if (!gst_init_check(nullptr, nullptr, &error)) {
        fprintf(stderr, "GStreamer: Failed to initialize GStreamer: %s\n",
                error ? error->message : "unknown error");
        if (error) g_error_free(error);
        return false;
    }

    // Encoded access units (or RTP packets) come out of an appsink we pull from
    std::string desc = pipeline_desc_ +
        " ! appsink name=websink_out sync=true max-buffers=4 drop=false";

    fprintf(stderr, "GStreamer: Creating pipeline: %s\n", desc.c_str());

    pipeline_ = gst_parse_launch(desc.c_str(), &error);
    if (error) {
        fprintf(stderr, "GStreamer: Pipeline error: %s\n", error->message);
        g_error_free(error);
        release();
        return false;
    }

    if (!pipeline_) {
        fprintf(stderr, "GStreamer: Failed to create pipeline\n");
        return false;
    }

    appsink_ = gst_bin_get_by_name(GST_BIN(pipeline_), "websink_out");
    if (!appsink_) {
        fprintf(stderr, "GStreamer: Failed to get appsink\n");
        release();
        return false;
    }
    bus_ = gst_element_get_bus(pipeline_);

    GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
    if (ret == GST_STATE_CHANGE_FAILURE) {
        fprintf(stderr, "GStreamer: Failed to start pipeline\n");
        release();
        return false;
    }

    on_format_ = std::move(on_format);
    render_ = std::move(render);
    running_ = true;
    thread_ = std::thread(&GstSampleSource::run, this);

    fprintf(stderr, "GStreamer: Pipeline playing\n");
    return true;
}

void GstSampleSource::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    release();
}

void GstSampleSource::release() {
    if (pipeline_) {
        gst_element_set_state(pipeline_, GST_STATE_NULL);
    }
    if (bus_) {
        gst_object_unref(bus_);
        bus_ = nullptr;
    }
    if (appsink_) {
        gst_object_unref(appsink_);
        appsink_ = nullptr;
    }
    if (pipeline_) {
        gst_object_unref(pipeline_);
        pipeline_ = nullptr;
    }
}

bool GstSampleSource::check_bus() {
    if (GstMessage* msg = gst_bus_pop_filtered(bus_, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS))) {
        if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
            GError* error = nullptr;
            gchar* debug = nullptr;
            gst_message_parse_error(msg, &error, &debug);
            fprintf(stderr, "GStreamer: Error from %s: %s\n",
                    GST_OBJECT_NAME(msg->src), error ? error->message : "unknown error");
            if (debug) {
                fprintf(stderr, "GStreamer: Debug info: %s\n", debug);
            }
            if (error) g_error_free(error);
            g_free(debug);
        } else {
            fprintf(stderr, "GStreamer: End of stream\n");
        }
        gst_message_unref(msg);
        return false;
    }
    return true;
}

bool GstSampleSource::check_format(GstSample* sample) {
    GstCaps* caps = gst_sample_get_caps(sample);
    if (!caps || gst_caps_get_size(caps) == 0) {
        fprintf(stderr, "GStreamer: First sample has no caps\n");
        return false;
    }

    GstStructure* structure = gst_caps_get_structure(caps, 0);
    std::string media_type = gst_structure_get_name(structure);
    const gchar* encoding = gst_structure_get_string(structure, "encoding-name");

    StreamFormat format;
    if (!format_from_caps(media_type, encoding ? encoding : "", &format)) {
        gchar* text = gst_caps_to_string(caps);
        fprintf(stderr, "GStreamer: Unsupported caps: %s\n", text);
        g_free(text);
        return false;
    }

    fprintf(stderr, "GStreamer: Detected %s in %s mode\n", codec_name(format.codec), stream_mode_name(format.mode));
    return !on_format_ || on_format_(format);
}

void GstSampleSource::run() {
    GstAppSink* appsink = GST_APP_SINK(appsink_);
    bool format_checked = false;

    while (running_) {
        if (!check_bus()) {
            break;
        }

        // Short timeout so stop() is noticed
        GstSample* sample = gst_app_sink_try_pull_sample(appsink, 100 * GST_MSECOND);
        if (!sample) {
            if (gst_app_sink_is_eos(appsink)) {
                fprintf(stderr, "GStreamer: End of stream\n");
                break;
            }
            continue;
        }

        if (!format_checked) {
            if (!check_format(sample)) {
                gst_sample_unref(sample);
                fprintf(stderr, "GStreamer: Stream format refused, stopping source\n");
                break;
            }
            format_checked = true;
        }

        websink::RenderResult result = websink::RenderResult::Delivered;
        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstMapInfo map;
        if (buffer && gst_buffer_map(buffer, &map, GST_MAP_READ)) {
            std::chrono::nanoseconds duration(0);
            if (GST_BUFFER_DURATION_IS_VALID(buffer)) {
                duration = std::chrono::nanoseconds(GST_BUFFER_DURATION(buffer));
            }
            result = render_(map.data, map.size, duration);
            gst_buffer_unmap(buffer, &map);
        } else {
            fprintf(stderr, "GStreamer: Failed to map sample buffer\n");
        }
        gst_sample_unref(sample);

        if (result == websink::RenderResult::Error) {
            fprintf(stderr, "GStreamer: Sink refused sample, stopping source\n");
            break;
        }
    }

    running_ = false;
}

} // namespace source
