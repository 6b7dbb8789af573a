#pragma once

#include <string_view>

#include "conneg/http-status-code.hpp"

namespace conneg::http {

// NOTE ON CASE SENSITIVITY
// ------------------------
// Header field names are case-insensitive, they are stored here in their canonical form for emission.
// Media type tokens on the other hand are matched byte for byte by the negotiation code, so the
// lowercase spelling below is the only one recognized.

// Standard Header Field Names
inline constexpr std::string_view Accept = "Accept";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentLength = "Content-Length";

// Media type tokens
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationCbor = "application/cbor";
inline constexpr std::string_view ContentTypeApplicationBeve = "application/x-beve";
inline constexpr std::string_view MediaTypeWildcard = "*/*";

// Reason Phrases (only those we currently emit explicitly)
inline constexpr std::string_view ReasonOK = "OK";                                        // 200
inline constexpr std::string_view ReasonCreated = "Created";                              // 201
inline constexpr std::string_view ReasonAccepted = "Accepted";                            // 202
inline constexpr std::string_view ReasonNoContent = "No Content";                         // 204
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                       // 400
inline constexpr std::string_view ReasonNotFound = "Not Found";                           // 404
inline constexpr std::string_view ReasonNotAcceptable = "Not Acceptable";                 // 406
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";            // 413
inline constexpr std::string_view ReasonUnsupportedMediaType = "Unsupported Media Type";  // 415
inline constexpr std::string_view ReasonUnprocessableEntity = "Unprocessable Entity";     // 422
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";    // 500
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";       // 503

// Return the canonical reason phrase for a subset of status codes we care about.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeAccepted:
      return ReasonAccepted;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeNotAcceptable:
      return ReasonNotAcceptable;
    case StatusCodePayloadTooLarge:
      return ReasonPayloadTooLarge;
    case StatusCodeUnsupportedMediaType:
      return ReasonUnsupportedMediaType;
    case StatusCodeUnprocessableEntity:
      return ReasonUnprocessableEntity;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    default:
      return {};
  }
}

}  // namespace conneg::http
