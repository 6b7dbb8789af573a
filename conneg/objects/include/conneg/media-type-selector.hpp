#pragma once

#include <optional>
#include <string_view>

#include "conneg/accept-parser.hpp"
#include "conneg/media-type-registry.hpp"
#include "conneg/media-type.hpp"

namespace conneg {

// Chooses the response media type of an exchange from the client preference list.
// Holds a reference to the registry, which must outlive the selector.
class MediaTypeSelector {
 public:
  explicit MediaTypeSelector(const MediaTypeRegistry &registry) noexcept : _registry(&registry) {}

  // Resolve candidates (already ordered by ParseAccept) against the registry:
  //  - '*/*' resolves to the registry default
  //  - other tokens must match a registered media type exactly, otherwise they are discarded
  // The first resolved candidate wins, that is the one with the highest weight, and the first seen among
  // equal weights. A weight of 0 is still acceptable when nothing better resolves.
  // Returns std::nullopt if no candidate resolves, meaning no acceptable output format.
  [[nodiscard]] std::optional<MediaType> select(const AcceptCandidates &candidates) const noexcept;

  // ParseAccept + select.
  [[nodiscard]] std::optional<MediaType> negotiateAccept(std::optional<std::string_view> acceptHeader) const;

  [[nodiscard]] const MediaTypeRegistry &registry() const noexcept { return *_registry; }

 private:
  const MediaTypeRegistry *_registry;
};

}  // namespace conneg
