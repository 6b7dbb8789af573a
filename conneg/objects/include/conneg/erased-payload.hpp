#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "conneg/codec-error.hpp"
#include "conneg/codec.hpp"
#include "conneg/media-type.hpp"

namespace conneg {

// Type-erased response value that can only be serialized.
//
// A handler produces a typed value before the response format is known to it. ErasedPayload boxes this value
// behind a single capability, "serialize into media type X", so that a later generic stage (NegotiationStage)
// can encode it with the format it selected before the handler ran, without knowing the concrete type.
//
// The boxed value is immutable and shared between copies: copying an ErasedPayload is cheap and allows it to
// travel as response metadata. Logically it is consumed once, by the stage that serializes it.
class ErasedPayload {
 public:
  template <class T>
    requires(!std::is_same_v<std::remove_cvref_t<T>, ErasedPayload>)
  explicit ErasedPayload(T &&value)
      : _impl(std::make_shared<const Model<std::remove_cvref_t<T>>>(std::forward<T>(value))) {}

  // Serializes the held value with the codec of 'mediaType'. The content of 'out' is replaced.
  [[nodiscard]] CodecResult serialize(MediaType mediaType, std::string &out) const {
    return _impl->serializeInto(mediaType, out);
  }

 private:
  class Concept {
   public:
    virtual ~Concept() = default;

    virtual CodecResult serializeInto(MediaType mediaType, std::string &out) const = 0;
  };

  template <class T>
  class Model final : public Concept {
   public:
    template <class U>
    explicit Model(U &&value) : _value(std::forward<U>(value)) {}

    CodecResult serializeInto(MediaType mediaType, std::string &out) const override {
      return EncodeValue(mediaType, _value, out);
    }

   private:
    T _value;
  };

  std::shared_ptr<const Concept> _impl;
};

}  // namespace conneg
