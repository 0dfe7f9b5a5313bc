/*
 * Render Gate
 *
 * Backpressure policy between the sample source and the distribution
 * track. With peers present every sample passes. With no peers:
 * - live mode drops the sample and returns at once, the upstream clock
 *   never stalls
 * - otherwise the producer thread waits on the unblock signal until a peer
 *   arrives or unlock() is called
 */

#ifndef RENDER_GATE_H
#define RENDER_GATE_H

#include "session_registry.h"
#include "unblock_signal.h"
#include <atomic>
#include <cstdint>

namespace websink {

enum class GateDecision {
    Pass,       // Hand the sample to the track
    Drop,       // Live mode, no peers: discard
    Shutdown    // Force-unblocked while waiting: nothing delivered, not an error
};

const char* gate_decision_name(GateDecision decision);

class RenderGate {
public:
    RenderGate(SessionRegistry& registry, UnblockSignal& signal);

    RenderGate(const RenderGate&) = delete;
    RenderGate& operator=(const RenderGate&) = delete;

    /**
     * Set the policy. Only called while the owning element is stopped.
     * @param live Drop instead of block when there are no peers
     * @param flush_on_unlock Deliver the pending sample if peers are present
     *        when a force-unblock wakes the waiter
     */
    void configure(bool live, bool flush_on_unlock);

    bool is_live() const { return live_.load(); }

    // Decide for one sample; may block (non-live mode, zero peers)
    GateDecision admit();

    // Wake a blocked admit() and make further waits return Shutdown
    void unlock();

    // Re-arm blocking after unlock(). A waiter that entered before the
    // unlock still returns Shutdown.
    void unlock_stop();

    bool is_unlocked() const { return unlocked_.load(); }

    // True while a producer is suspended in admit()
    bool is_waiting() const { return waiting_.load(); }

private:
    GateDecision on_force_unblock();

    SessionRegistry& registry_;
    UnblockSignal& signal_;
    std::atomic<bool> live_;
    std::atomic<bool> flush_on_unlock_;
    std::atomic<bool> unlocked_;
    std::atomic<uint64_t> unlock_generation_;
    std::atomic<bool> waiting_;
};

} // namespace websink

#endif // RENDER_GATE_H
