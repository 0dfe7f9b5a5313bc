/*
 * Distribution Track
 *
 * The current encoded stream. Every sample written here is handed, as one
 * shared immutable buffer, to each session in the registry's snapshot.
 * A failing peer is logged and skipped; it never stops delivery to the
 * others and never reaches the producer. Only the producer thread writes.
 */

#ifndef DISTRIBUTION_TRACK_H
#define DISTRIBUTION_TRACK_H

#include "peer_transport.h"
#include "session_registry.h"
#include <atomic>
#include <chrono>
#include <cstdint>

namespace websink {

/**
 * Outcome of one write_sample call
 */
struct DeliveryStats {
    size_t delivered = 0;   // Peers that accepted the sample
    size_t skipped = 0;     // Peers not ready yet (track not open) or closing
    size_t failed = 0;      // Peers whose transport rejected the sample
};

class DistributionTrack {
public:
    DistributionTrack(SessionRegistry& registry, TrackInfo info, bool debug = false);

    DistributionTrack(const DistributionTrack&) = delete;
    DistributionTrack& operator=(const DistributionTrack&) = delete;

    const TrackInfo& info() const { return info_; }

    /**
     * Fan one sample out to all registered peers
     * @param data Encoded payload (copied once, shared by all peers)
     * @param size Payload size in bytes
     * @param duration Sample duration, zero or negative means unknown
     */
    DeliveryStats write_sample(const uint8_t* data, size_t size, std::chrono::nanoseconds duration);

    uint64_t samples_written() const { return samples_written_.load(); }
    uint64_t delivery_errors() const { return delivery_errors_.load(); }

private:
    SessionRegistry& registry_;
    TrackInfo info_;
    bool debug_;

    std::chrono::nanoseconds next_timestamp_;
    std::atomic<uint64_t> samples_written_;
    std::atomic<uint64_t> delivery_errors_;
};

} // namespace websink

#endif // DISTRIBUTION_TRACK_H
