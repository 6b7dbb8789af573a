#include "conneg/media-type-registry.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

#include "conneg/log.hpp"
#include "conneg/media-type.hpp"
#include "conneg/negotiation-config.hpp"

namespace conneg {

MediaTypeRegistry::MediaTypeRegistry(const NegotiationConfig &config)
    : _formats(config.formats), _default(config.defaultFormat) {
  config.validate();
  for (MediaType mediaType : _formats) {
    _registered[static_cast<std::uint8_t>(mediaType)] = true;
  }
  log::debug("Media type registry initialized with {} format(s), default {}", _formats.size(),
             GetMediaTypeStr(_default));
}

std::optional<MediaType> MediaTypeRegistry::resolve(std::string_view token) const noexcept {
  const auto mediaType = MediaTypeFromToken(token);
  if (mediaType && contains(*mediaType)) {
    return mediaType;
  }
  return std::nullopt;
}

}  // namespace conneg
