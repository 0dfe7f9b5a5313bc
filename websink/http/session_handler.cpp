/*
 * Signaling Handler Module
 *
 * Implementation of the /api/session endpoint
 */

#include "session_handler.h"
#include "../core/sink_errors.h"
#include "../utils/json_utils.h"
#include <cstdio>

namespace http {

using json_utils::json;

SessionHandler::SessionHandler(AdmitFunction admit_fn, bool debug_connection)
    : admit_fn_(std::move(admit_fn))
    , debug_connection_(debug_connection)
{}

Response SessionHandler::handle(const Request& req) {
    if (req.path == "/api/session") {
        if (req.method != "POST") {
            Response resp = Response::text("Method not allowed", 405);
            resp.add_header("Allow", "POST");
            return resp;
        }
        return handle_session(req);
    }
    return Response::not_found();
}

Response SessionHandler::error_json(const std::string& message, int status) {
    json body = {{"error", message}};
    return Response::json(json_utils::to_string(body), status);
}

bool SessionHandler::parse_offer(const std::string& body, websink::SessionDescription* offer, std::string* error) {
    json request;
    if (!json_utils::try_parse(body, &request)) {
        *error = "Error parsing JSON";
        return false;
    }

    if (!request.is_object() || !request.contains("offer") || !request["offer"].is_object()) {
        *error = "Missing offer";
        return false;
    }

    const json& offer_json = request["offer"];
    std::string type = json_utils::get_string(offer_json, "type");
    std::string sdp = json_utils::get_string(offer_json, "sdp");

    if (type != "offer") {
        *error = "Invalid offer type: " + (type.empty() ? std::string("(none)") : type);
        return false;
    }
    if (sdp.empty()) {
        *error = "Offer has no SDP";
        return false;
    }

    offer->type = type;
    offer->sdp = sdp;
    return true;
}

Response SessionHandler::handle_session(const Request& req) {
    websink::SessionDescription offer;
    std::string error;
    if (!parse_offer(req.body, &offer, &error)) {
        if (debug_connection_) {
            fprintf(stderr, "[Signaling] Rejected request: %s\n", error.c_str());
        }
        return Response::text(error, 400);
    }

    if (debug_connection_) {
        fprintf(stderr, "[Signaling] Received offer (sdp length=%zu)\n", offer.sdp.size());
    }

    websink::Admission admission;
    try {
        admission = admit_fn_(offer);
    } catch (const websink::NotStartedError& e) {
        return error_json(e.what(), 503);
    } catch (const websink::NegotiationError& e) {
        fprintf(stderr, "[Signaling] Negotiation failed: %s\n", e.what());
        return error_json(e.what(), 500);
    } catch (const websink::DuplicateIdError& e) {
        fprintf(stderr, "[Signaling] %s\n", e.what());
        return error_json(e.what(), 500);
    }

    json response = {
        {"answer", {
            {"type", admission.answer.type},
            {"sdp", admission.answer.sdp}
        }},
        {"sessionId", admission.peer_id},
        {"negotiatedCodec", admission.negotiated_codec}
    };

    if (debug_connection_) {
        fprintf(stderr, "[Signaling] Sent answer to %s (sdp length=%zu)\n",
                admission.peer_id.c_str(), admission.answer.sdp.size());
    }
    return Response::json(json_utils::to_string(response));
}

} // namespace http
