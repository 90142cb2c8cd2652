#pragma once
#include <flywheel/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace flywheel::schema::key {

/// Appends fixed-width key segments. Integers are written big-endian so that
/// RocksDB's lexicographic iteration matches numeric order.
struct builder final {
  flywheel::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    const auto big = boost::endian::native_to_big(value);
    const auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace flywheel::schema::key
