/*
 * Admission Errors
 *
 * Failures of a single admission attempt. They are reported to the
 * request that caused them and never affect other peers.
 */

#ifndef SINK_ERRORS_H
#define SINK_ERRORS_H

#include <stdexcept>
#include <string>

namespace websink {

class SinkError : public std::runtime_error {
public:
    explicit SinkError(const std::string& message)
        : std::runtime_error(message) {}
};

// A peer id was already registered (unique id allocation makes this unexpected)
class DuplicateIdError : public SinkError {
public:
    explicit DuplicateIdError(const std::string& peer_id)
        : SinkError("Duplicate peer id: " + peer_id)
        , peer_id_(peer_id) {}

    const std::string& peer_id() const { return peer_id_; }

private:
    std::string peer_id_;
};

// Offer/answer exchange failed; the partial session has been rolled back
class NegotiationError : public SinkError {
public:
    NegotiationError(const std::string& stage, const std::string& cause)
        : SinkError(stage + ": " + cause)
        , stage_(stage)
        , cause_(cause) {}

    const std::string& stage() const { return stage_; }
    const std::string& cause() const { return cause_; }

private:
    std::string stage_;
    std::string cause_;
};

// Admission attempted while the element is stopped
class NotStartedError : public SinkError {
public:
    NotStartedError()
        : SinkError("WebSink is not started") {}
};

} // namespace websink

#endif // SINK_ERRORS_H
