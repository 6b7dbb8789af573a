#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "conneg/fixedcapacityvector.hpp"
#include "conneg/media-type.hpp"
#include "conneg/negotiation-config.hpp"

namespace conneg {

// Immutable set of media types offered by a service, with its designated default.
// Built once at startup and then only read, so it may be shared by concurrent exchanges without synchronization.
class MediaTypeRegistry {
 public:
  // Validates the config (throws std::invalid_argument on error) and builds the registry from it.
  explicit MediaTypeRegistry(const NegotiationConfig &config);

  [[nodiscard]] bool contains(MediaType mediaType) const noexcept {
    return _registered[static_cast<std::uint8_t>(mediaType)];
  }

  // Exact match of given token against the registered media types only.
  // The wildcard is not resolved here, it is a property of Accept negotiation.
  [[nodiscard]] std::optional<MediaType> resolve(std::string_view token) const noexcept;

  [[nodiscard]] MediaType defaultMediaType() const noexcept { return _default; }

  // Registered media types, in registration order.
  [[nodiscard]] std::span<const MediaType> formats() const noexcept { return {_formats.data(), _formats.size()}; }

 private:
  FixedCapacityVector<MediaType, kNbMediaTypes> _formats;
  bool _registered[kNbMediaTypes]{};
  MediaType _default;
};

}  // namespace conneg
