#pragma once

#include <glaze/cbor.hpp>   // IWYU pragma: export
#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>
#include <string_view>
#include <utility>

#include "conneg/codec-error.hpp"
#include "conneg/media-type.hpp"

// =============================================================================
// Codec boundary
// =============================================================================
// Each MediaType is backed by one glaze format:
//   application/json    -> glz::write_json / glz::read_json
//   application/cbor    -> glz::write_cbor / glz::read_cbor (RFC 8949)
//   application/x-beve  -> glz::write_beve / glz::read_beve
// Any type glaze can reflect (aggregates, or types with a glz::meta specialization) can be used.
//
// Decoding is strict: unknown keys and missing keys are reported as errors, so that a body which does not follow
// the expected schema is rejected rather than silently partially applied. Members of type std::optional may be omitted.
// =============================================================================

namespace conneg {

namespace detail {

inline constexpr glz::opts kJsonReadOpts{.error_on_missing_keys = true};
inline constexpr glz::opts kCborReadOpts{.format = glz::CBOR, .error_on_missing_keys = true};
inline constexpr glz::opts kBeveReadOpts{.format = glz::BEVE, .error_on_missing_keys = true};

}  // namespace detail

// Encodes 'value' with the codec of 'mediaType'. The content of 'out' is replaced by the encoded bytes.
// On error 'out' is cleared.
template <class T>
[[nodiscard]] CodecResult EncodeValue(MediaType mediaType, const T &value, std::string &out) {
  glz::error_ctx ec{};
  switch (mediaType) {
    case MediaType::json:
      ec = glz::write_json(value, out);
      break;
    case MediaType::cbor:
      ec = glz::write_cbor(value, out);
      break;
    case MediaType::beve:
      ec = glz::write_beve(value, out);
      break;
    default:
      std::unreachable();
  }
  if (ec) {
    out.clear();
    return CodecResult(CodecError{mediaType, glz::format_error(ec)});
  }
  return {};
}

// Decodes 'bytes' with the codec of 'mediaType' into 'value'.
template <class T>
[[nodiscard]] CodecResult DecodeValue(MediaType mediaType, std::string_view bytes, T &value) {
  // glaze expects null terminated input for text formats
  const std::string buffer(bytes);
  glz::error_ctx ec{};
  switch (mediaType) {
    case MediaType::json:
      ec = glz::read<detail::kJsonReadOpts>(value, buffer);
      break;
    case MediaType::cbor:
      ec = glz::read<detail::kCborReadOpts>(value, buffer);
      break;
    case MediaType::beve:
      ec = glz::read<detail::kBeveReadOpts>(value, buffer);
      break;
    default:
      std::unreachable();
  }
  if (ec) {
    return CodecResult(CodecError{mediaType, glz::format_error(ec, buffer)});
  }
  return {};
}

}  // namespace conneg
