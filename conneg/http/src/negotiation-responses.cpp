#include "conneg/negotiation-responses.hpp"

#include <string>
#include <utility>

#include "conneg/erased-payload.hpp"
#include "conneg/http-constants.hpp"
#include "conneg/http-response.hpp"
#include "conneg/http-status-code.hpp"

namespace conneg {

HttpResponse MakeNotAcceptableResponse() {
  return HttpResponse(http::StatusCodeNotAcceptable).body(std::string(kNotAcceptableBody), {});
}

HttpResponse MakeMalformedBodyResponse() {
  return HttpResponse(http::StatusCodeBadRequest).body(std::string(kMalformedBodyBody));
}

HttpResponse MakeMisconfiguredResponse(ErasedPayload payload) {
  return HttpResponse(http::StatusCodeUnsupportedMediaType)
      .body(std::string(kMisconfiguredBody))
      .negotiatedPayload(std::move(payload));
}

HttpResponse MakeEncodeFailureResponse() {
  return HttpResponse(http::StatusCodeInternalServerError).body(std::string(kEncodeFailureBody));
}

}  // namespace conneg
