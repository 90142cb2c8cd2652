#pragma once
#include <flywheel/schema/primitives.hpp>
#include <optional>
#include <span>

namespace flywheel::schema::encoding {

/// Build-time selected wire codec. Storage rows, event records and hook
/// payloads all go through one specialization so that encodings stay
/// bit-stable across the engine and its callers.
template <typename Library>
struct encoder {
  template <typename T>
  flywheel::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, flywheel::schema::bytes_t& out);

  template <typename T>
  T decode(const flywheel::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const flywheel::schema::bytes_view_t& bytes);
};

}  // namespace flywheel::schema::encoding
