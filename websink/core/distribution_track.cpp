/*
 * Distribution Track
 */

#include "distribution_track.h"
#include <cstdio>

namespace websink {

DistributionTrack::DistributionTrack(SessionRegistry& registry, TrackInfo info, bool debug)
    : registry_(registry)
    , info_(std::move(info))
    , debug_(debug)
    , next_timestamp_(0)
    , samples_written_(0)
    , delivery_errors_(0)
{
    if (info_.mime_type.empty()) {
        info_.mime_type = codec_mime_type(info_.codec);
    }
}

DeliveryStats DistributionTrack::write_sample(const uint8_t* data, size_t size,
                                              std::chrono::nanoseconds duration) {
    DeliveryStats stats;

    EncodedSample sample;
    sample.data = std::make_shared<const std::vector<uint8_t>>(data, data + size);
    sample.duration = duration.count() > 0 ? duration : DEFAULT_SAMPLE_DURATION;
    sample.timestamp = next_timestamp_;
    sample.sequence = samples_written_.load();

    next_timestamp_ += sample.duration;
    samples_written_++;

    for (const auto& session : registry_.snapshot()) {
        try {
            if (session->deliver(sample)) {
                stats.delivered++;
            } else {
                stats.skipped++;
            }
        } catch (const std::exception& e) {
            // The peer's own state observer takes care of removing it
            stats.failed++;
            delivery_errors_++;
            fprintf(stderr, "[WebSink] Delivery error to peer %s: %s\n",
                    session->id().c_str(), e.what());
        }
    }

    if (debug_) {
        fprintf(stderr, "[WebSink] Sample #%llu (%zu bytes): delivered=%zu skipped=%zu failed=%zu\n",
                static_cast<unsigned long long>(sample.sequence), size,
                stats.delivered, stats.skipped, stats.failed);
    }

    return stats;
}

} // namespace websink
