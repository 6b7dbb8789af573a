#pragma once

#include <string_view>

#include "conneg/erased-payload.hpp"
#include "conneg/http-response.hpp"

namespace conneg {

// Fixed diagnostic bodies. They never contain request or codec details.
inline constexpr std::string_view kNotAcceptableBody = "Invalid content type on request";
inline constexpr std::string_view kMalformedBodyBody = "Malformed request body";
inline constexpr std::string_view kMisconfiguredBody = "Misconfigured service layer";
inline constexpr std::string_view kEncodeFailureBody = "Failed to serialize response";

// 406 emitted when no acceptable format exists for the exchange, or when the declared inbound
// media type is not registered. It carries no Content-Type header.
[[nodiscard]] HttpResponse MakeNotAcceptableResponse();

// 400 emitted when the request body cannot be decoded with its declared format.
[[nodiscard]] HttpResponse MakeMalformedBodyResponse();

// Placeholder response holding a negotiated payload.
// Its 415 status makes a response that escaped the negotiation stage read as a server side misconfiguration.
[[nodiscard]] HttpResponse MakeMisconfiguredResponse(ErasedPayload payload);

// 500 emitted when the negotiated payload cannot be encoded.
[[nodiscard]] HttpResponse MakeEncodeFailureResponse();

}  // namespace conneg
