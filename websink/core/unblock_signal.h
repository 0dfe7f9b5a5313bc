/*
 * Unblock Signal
 *
 * Single-slot, last-value notification channel between the session
 * registry (and the element's unlock path) and a render call waiting for
 * peers. Sending never blocks: a new event overwrites an unconsumed one.
 */

#ifndef UNBLOCK_SIGNAL_H
#define UNBLOCK_SIGNAL_H

#include <mutex>
#include <condition_variable>
#include <optional>
#include <cstddef>

namespace websink {

struct UnblockEvent {
    enum class Kind {
        SizeChanged,    // Registry size changed, peer_count holds the new size
        ForceUnblock    // Shutdown/unlock requested
    };

    Kind kind = Kind::SizeChanged;
    size_t peer_count = 0;

    static UnblockEvent size_changed(size_t count) { return {Kind::SizeChanged, count}; }
    static UnblockEvent force_unblock() { return {Kind::ForceUnblock, 0}; }
};

class UnblockSignal {
public:
    UnblockSignal() = default;

    UnblockSignal(const UnblockSignal&) = delete;
    UnblockSignal& operator=(const UnblockSignal&) = delete;

    // Store the event, replacing any pending one, and wake a waiter
    void send(const UnblockEvent& event);

    // Block until an event is pending and take it
    UnblockEvent wait();

    // Take the pending event without blocking
    std::optional<UnblockEvent> try_take();

    // Drop any pending event
    void clear();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<UnblockEvent> slot_;
};

} // namespace websink

#endif // UNBLOCK_SIGNAL_H
