#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include "conneg/http-request.hpp"
#include "conneg/http-response.hpp"
#include "conneg/request-task.hpp"

namespace conneg {

// Result of running a pre-handler stage.
class MiddlewareResult {
 public:
  enum class Decision : std::uint8_t { Continue, ShortCircuit };

  // Default to Continue.
  MiddlewareResult() noexcept = default;

  // Constructor to short-circuit response with given one.
  explicit MiddlewareResult(HttpResponse response) noexcept
      : _decision(Decision::ShortCircuit), _response(std::move(response)) {}

  static MiddlewareResult Continue() noexcept { return {}; }

  static MiddlewareResult ShortCircuit(HttpResponse response) noexcept { return MiddlewareResult{std::move(response)}; }

  [[nodiscard]] bool shouldContinue() const noexcept { return _decision == Decision::Continue; }

  [[nodiscard]] bool shouldShortCircuit() const noexcept { return _decision == Decision::ShortCircuit; }

  [[nodiscard]] HttpResponse&& takeResponse() && noexcept { return std::move(_response); }

 private:
  Decision _decision{Decision::Continue};
  HttpResponse _response;
};

// Business logic of an exchange. Runs between the pre-handler and post-handler stages.
using RequestHandler = std::function<HttpResponse(HttpRequest&)>;

// Coroutine flavor of RequestHandler. The returned task is awaited by the wrapping stage.
using AsyncRequestHandler = std::function<RequestTask<HttpResponse>(HttpRequest&)>;

}  // namespace conneg
