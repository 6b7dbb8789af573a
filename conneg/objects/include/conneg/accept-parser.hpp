#pragma once

#include <optional>
#include <string_view>

#include "conneg/smallvector.hpp"

namespace conneg {

// One entry of an Accept preference list.
struct AcceptCandidate {
  // Media type token, not resolved against any registry. May be the wildcard "*/*".
  std::string_view token;
  // Quality weight in [0, 1].
  double quality{1.0};

  bool operator==(const AcceptCandidate &) const noexcept = default;
};

// Candidates are views on the parsed header value: the header must outlive them.
using AcceptCandidates = SmallVector<AcceptCandidate, 8>;

// Parse an Accept header value into candidates ordered by descending quality.
// Rules implemented:
//  - Split on commas, each entry being 'token[;param]*'. Entries empty after trimming are skipped.
//  - Only the q parameter is considered (q=0..1, default 1.0). A malformed q value does not drop
//    the entry, its weight becomes 0. Out of range values are clamped.
//  - Equal weights keep their order of appearance (stable sort), which decides ties at selection.
//  - An absent header is equivalent to a single '*/*' entry with weight 1.
// Media type parameters other than q, and partial wildcards such as 'text/*', are not interpreted:
// such a token simply will not match any registered media type.
[[nodiscard]] AcceptCandidates ParseAccept(std::optional<std::string_view> acceptHeader);

}  // namespace conneg
