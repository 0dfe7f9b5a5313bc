/*
 * Signaling Handler Module
 *
 * POST /api/session: one offer in, one answer out.
 *
 *   request:  {"offer": {"type": "offer", "sdp": "..."}}
 *   response: {"answer": {"type": "answer", "sdp": "..."},
 *              "sessionId": "<id>", "negotiatedCodec": "video/H264"}
 *
 * The body is validated before anything is admitted, so a malformed
 * request never creates a session.
 */

#ifndef SESSION_HANDLER_H
#define SESSION_HANDLER_H

#include "http_server.h"
#include "../core/peer_factory.h"
#include <string>
#include <functional>

namespace http {

/**
 * Admission callback: runs the handshake for one validated offer
 * Throws NotStartedError, DuplicateIdError or NegotiationError.
 */
using AdmitFunction = std::function<websink::Admission(const websink::SessionDescription&)>;

class SessionHandler {
public:
    explicit SessionHandler(AdmitFunction admit_fn, bool debug_connection = false);

    // Route one request (anything other than /api/session is 404)
    Response handle(const Request& req);

    /**
     * Extract the offer from a request body
     * @return false if the body is not JSON or the offer is missing/invalid
     */
    static bool parse_offer(const std::string& body, websink::SessionDescription* offer, std::string* error);

private:
    Response handle_session(const Request& req);

    static Response error_json(const std::string& message, int status);

    AdmitFunction admit_fn_;
    bool debug_connection_;
};

} // namespace http

#endif // SESSION_HANDLER_H
