#include "conneg/negotiation-config.hpp"

#include <algorithm>
#include <format>
#include <initializer_list>
#include <iterator>
#include <stdexcept>

#include "conneg/media-type.hpp"

namespace conneg {

void NegotiationConfig::validate() const {
  if (formats.empty()) {
    throw std::invalid_argument("At least one media type should be registered");
  }
  for (auto it = formats.begin(); it != formats.end(); ++it) {
    if (std::find(std::next(it), formats.end(), *it) != formats.end()) {
      throw std::invalid_argument(std::format("Media type {} registered twice", GetMediaTypeStr(*it)));
    }
  }
  if (std::ranges::find(formats, defaultFormat) == formats.end()) {
    throw std::invalid_argument(
        std::format("Default media type {} is not among the registered ones", GetMediaTypeStr(defaultFormat)));
  }
}

NegotiationConfig& NegotiationConfig::withFormat(MediaType mediaType) {
  formats.push_back(mediaType);
  return *this;
}

NegotiationConfig& NegotiationConfig::withFormats(std::initializer_list<MediaType> mediaTypes) {
  formats.clear();
  for (MediaType mediaType : mediaTypes) {
    formats.push_back(mediaType);
  }
  return *this;
}

NegotiationConfig& NegotiationConfig::withDefaultFormat(MediaType mediaType) {
  defaultFormat = mediaType;
  return *this;
}

}  // namespace conneg
