#include "conneg/media-type-selector.hpp"

#include <optional>
#include <string_view>

#include "conneg/accept-parser.hpp"
#include "conneg/http-constants.hpp"
#include "conneg/log.hpp"
#include "conneg/media-type.hpp"

namespace conneg {

std::optional<MediaType> MediaTypeSelector::select(const AcceptCandidates &candidates) const noexcept {
  for (const AcceptCandidate &candidate : candidates) {
    if (candidate.token == http::MediaTypeWildcard) {
      return _registry->defaultMediaType();
    }
    if (auto mediaType = _registry->resolve(candidate.token)) {
      return mediaType;
    }
  }
  return std::nullopt;
}

std::optional<MediaType> MediaTypeSelector::negotiateAccept(std::optional<std::string_view> acceptHeader) const {
  const auto candidates = ParseAccept(acceptHeader);
  auto selected = select(candidates);
  if (selected) {
    log::debug("Accept '{}' negotiated to {}", acceptHeader.value_or(http::MediaTypeWildcard),
               GetMediaTypeStr(*selected));
  } else {
    log::debug("Accept '{}' matches none of the {} registered media type(s)", acceptHeader.value_or(""),
               _registry->formats().size());
  }
  return selected;
}

}  // namespace conneg
