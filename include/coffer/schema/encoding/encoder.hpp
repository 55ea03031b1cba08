#pragma once
#include <coffer/schema/primitives.hpp>
#include <optional>
#include <span>

namespace coffer::schema::encoding {

// The encoding library is a build time choice made through the tag type.
// Callers name `scale_encoder_t`; swapping the wire format means
// adding another specialization, not touching call sites.
template <typename Library>
struct encoder {
  template <typename T>
  coffer::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const coffer::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const coffer::schema::bytes_view_t& bytes);
};

}  // namespace coffer::schema::encoding
