/*
 * Unblock Signal
 */

#include "unblock_signal.h"

namespace websink {

void UnblockSignal::send(const UnblockEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = event;
    }
    cv_.notify_all();
}

UnblockEvent UnblockSignal::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return slot_.has_value(); });
    UnblockEvent event = *slot_;
    slot_.reset();
    return event;
}

std::optional<UnblockEvent> UnblockSignal::try_take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<UnblockEvent> event = slot_;
    slot_.reset();
    return event;
}

void UnblockSignal::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    slot_.reset();
}

} // namespace websink
