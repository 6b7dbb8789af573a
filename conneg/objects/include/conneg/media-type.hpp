#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "conneg/http-constants.hpp"

namespace conneg {

// Wire formats this library knows how to encode and decode.
// Which of them are actually offered is decided at runtime by the MediaTypeRegistry.
enum class MediaType : std::uint8_t {
  json,
  cbor,
  beve,
};

inline constexpr std::underlying_type_t<MediaType> kNbMediaTypes =
    static_cast<std::underlying_type_t<MediaType>>(MediaType::beve) + 1;

// Get the canonical media type token, as emitted in Content-Type headers.
constexpr std::string_view GetMediaTypeStr(MediaType mediaType) {
  constexpr std::string_view kMediaTypeStrs[kNbMediaTypes] = {
      http::ContentTypeApplicationJson,
      http::ContentTypeApplicationCbor,
      http::ContentTypeApplicationBeve,
  };
  if (static_cast<std::underlying_type_t<MediaType>>(mediaType) >= kNbMediaTypes) [[unlikely]] {
    return "unknown";
  }
  return kMediaTypeStrs[static_cast<std::underlying_type_t<MediaType>>(mediaType)];
}

// Exact (byte for byte) lookup of a token among all known media types, registered or not.
constexpr std::optional<MediaType> MediaTypeFromToken(std::string_view token) {
  for (std::underlying_type_t<MediaType> pos = 0; pos < kNbMediaTypes; ++pos) {
    const auto mediaType = static_cast<MediaType>(pos);
    if (GetMediaTypeStr(mediaType) == token) {
      return mediaType;
    }
  }
  return std::nullopt;
}

}  // namespace conneg
