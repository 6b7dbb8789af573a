#include "conneg/accept-parser.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <functional>
#include <optional>
#include <ranges>
#include <string_view>
#include <system_error>

#include "conneg/http-constants.hpp"

namespace conneg {
namespace {

constexpr std::string_view kWhitespace = " \t";

constexpr std::string_view trim(std::string_view sv) {
  while (!sv.empty() && kWhitespace.find(sv.front()) != std::string_view::npos) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && kWhitespace.find(sv.back()) != std::string_view::npos) {
    sv.remove_suffix(1);
  }
  return sv;
}

// Parse q-value among the parameters of an entry (the part after the first ';'); never throws.
double parseQ(std::string_view params) {
  while (!params.empty()) {
    auto nextSemi = params.find(';');
    std::string_view param = trim(nextSemi == std::string_view::npos ? params : params.substr(0, nextSemi));
    if (nextSemi == std::string_view::npos) {
      params = {};
    } else {
      params.remove_prefix(nextSemi + 1);
    }
    if (param.size() < 2 || (param[0] != 'q' && param[0] != 'Q') || param[1] != '=') {
      continue;
    }
    auto val = trim(param.substr(2));
    if (val.empty()) {
      return 0.0;
    }
    double qualityValue = 0.0;
    const char *begin = val.data();
    const char *end = begin + val.size();
    auto fcRes = std::from_chars(begin, end, qualityValue);
    if (fcRes.ec != std::errc() || fcRes.ptr != end || !std::isfinite(qualityValue)) {
      return 0.0;  // invalid format, nan or inf
    }
    return std::clamp(qualityValue, 0.0, 1.0);
  }
  return 1.0;
}

}  // namespace

AcceptCandidates ParseAccept(std::optional<std::string_view> acceptHeader) {
  AcceptCandidates candidates;
  if (!acceptHeader) {
    candidates.emplace_back(http::MediaTypeWildcard, 1.0);
    return candidates;
  }

  for (auto part : *acceptHeader | std::views::split(',')) {
    std::string_view raw = trim(std::string_view(part.begin(), part.end()));
    if (raw.empty()) {
      continue;
    }
    const auto sc = raw.find(';');
    std::string_view token = trim(sc == std::string_view::npos ? raw : raw.substr(0, sc));
    if (token.empty()) {
      continue;
    }
    candidates.emplace_back(token, sc == std::string_view::npos ? 1.0 : parseQ(raw.substr(sc + 1)));
  }

  std::ranges::stable_sort(candidates, std::greater{}, &AcceptCandidate::quality);
  return candidates;
}

}  // namespace conneg
