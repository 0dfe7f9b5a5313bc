/*
 * Render Gate
 */

#include "render_gate.h"

namespace websink {

const char* gate_decision_name(GateDecision decision) {
    switch (decision) {
        case GateDecision::Pass: return "pass";
        case GateDecision::Drop: return "drop";
        case GateDecision::Shutdown: return "shutdown";
    }
    return "unknown";
}

RenderGate::RenderGate(SessionRegistry& registry, UnblockSignal& signal)
    : registry_(registry)
    , signal_(signal)
    , live_(false)
    , flush_on_unlock_(false)
    , unlocked_(false)
    , unlock_generation_(0)
    , waiting_(false)
{}

void RenderGate::configure(bool live, bool flush_on_unlock) {
    live_ = live;
    flush_on_unlock_ = flush_on_unlock;
}

GateDecision RenderGate::admit() {
    if (registry_.count() > 0) {
        return GateDecision::Pass;
    }

    if (live_) {
        return GateDecision::Drop;
    }

    // Any unlock() after this point releases the waiter, even if
    // unlock_stop() follows before it wakes
    const uint64_t generation = unlock_generation_.load();
    waiting_ = true;
    GateDecision decision = GateDecision::Pass;
    while (true) {
        if (unlocked_ || unlock_generation_.load() != generation) {
            decision = on_force_unblock();
            break;
        }
        if (registry_.count() > 0) {
            break;
        }

        // The slot keeps the last event, so a change between the checks
        // above and this wait is not lost. A ForceUnblock left over from
        // an unlock() before entry is stale and ignored.
        UnblockEvent event = signal_.wait();
        if (event.kind == UnblockEvent::Kind::ForceUnblock &&
            unlock_generation_.load() != generation) {
            decision = on_force_unblock();
            break;
        }
    }
    waiting_ = false;
    return decision;
}

GateDecision RenderGate::on_force_unblock() {
    if (flush_on_unlock_ && registry_.count() > 0) {
        return GateDecision::Pass;
    }
    return GateDecision::Shutdown;
}

void RenderGate::unlock() {
    unlock_generation_++;
    unlocked_ = true;
    signal_.send(UnblockEvent::force_unblock());
}

void RenderGate::unlock_stop() {
    unlocked_ = false;
}

} // namespace websink
