// conneg Umbrella Header
//
// Include this single header to pull in the public content negotiation API:
//   - Configuration and registry (NegotiationConfig, MediaTypeRegistry, MediaType)
//   - Accept parsing and format selection (ParseAccept, MediaTypeSelector)
//   - Codecs (EncodeValue / DecodeValue) and type erasure (ErasedPayload)
//   - Exchange model (HttpRequest, HttpResponse, RequestTask, MiddlewareResult)
//   - Negotiation (DecodeRequestBody, Negotiate<T>, NegotiationStage)
//
// Usage Example:
//    #include <conneg/conneg.hpp>
//    using namespace conneg;
//    int main() {
//      MediaTypeRegistry registry(NegotiationConfig{}.withDefaultFormat(MediaType::cbor));
//      NegotiationStage stage(registry);
//      HttpRequest request;
//      request.addHeader(http::Accept, "application/json");
//      HttpResponse response = stage.handle(request, [](HttpRequest &) {
//        return Negotiate(std::vector<int>{1, 2, 3}).intoResponse();
//      });
//    }
#pragma once

// IWYU pragma: begin_exports
#include "conneg/accept-parser.hpp"
#include "conneg/codec-error.hpp"
#include "conneg/codec.hpp"
#include "conneg/erased-payload.hpp"
#include "conneg/http-constants.hpp"
#include "conneg/http-request.hpp"
#include "conneg/http-response.hpp"
#include "conneg/http-status-code.hpp"
#include "conneg/media-type-registry.hpp"
#include "conneg/media-type-selector.hpp"
#include "conneg/media-type.hpp"
#include "conneg/middleware.hpp"
#include "conneg/negotiate.hpp"
#include "conneg/negotiation-config.hpp"
#include "conneg/negotiation-responses.hpp"
#include "conneg/negotiation-stage.hpp"
#include "conneg/request-body-decoder.hpp"
#include "conneg/request-task.hpp"
// IWYU pragma: end_exports
