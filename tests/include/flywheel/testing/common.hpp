#pragma once

#include <flywheel/schema/encoding/scale/encoder.hpp>
#include <flywheel/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace flywheel::testing {

inline flywheel::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = flywheel::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline flywheel::schema::address_t make_address(const uint8_t seed) {
  auto out = flywheel::schema::address_t{};
  out[0] = 0xA0;
  out[19] = seed;
  return out;
}

template <typename T>
flywheel::schema::bytes_t encode(const T& value) {
  auto encoder = flywheel::schema::encoding::scale_encoder_t{};
  return encoder.encode(value);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace flywheel::testing
