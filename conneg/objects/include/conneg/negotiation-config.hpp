#pragma once

#include <initializer_list>

#include "conneg/fixedcapacityvector.hpp"
#include "conneg/media-type.hpp"

namespace conneg {

// Static description of the formats offered by a service, built once at startup.
struct NegotiationConfig {
  // Throws std::invalid_argument if the configuration cannot produce a usable registry:
  //  - no format registered
  //  - a format registered twice
  //  - default format not part of the registered ones
  void validate() const;

  // Registers one more format. Order of registration is kept but has no influence on selection,
  // which only depends on the client preference list.
  NegotiationConfig& withFormat(MediaType mediaType);

  // Replaces the registered formats.
  NegotiationConfig& withFormats(std::initializer_list<MediaType> mediaTypes);

  // Format used when the request has no Content-Type header, no Accept header, or accepts '*/*'.
  NegotiationConfig& withDefaultFormat(MediaType mediaType);

  FixedCapacityVector<MediaType, kNbMediaTypes> formats{MediaType::json, MediaType::cbor};

  MediaType defaultFormat{MediaType::json};
};

}  // namespace conneg
