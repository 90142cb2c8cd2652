#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flywheel::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using uint256_t = boost::multiprecision::uint256_t;
using amount_t = uint256_t;
using nonce_t = uint256_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

/// Sentinel asset address denoting the network's native currency.
inline constexpr auto kNativeToken =
    address_t{0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE,
              0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE};

inline bool is_native(const address_t& asset) {
  return asset == kNativeToken;
}

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

std::optional<hash32_t> try_make_hash32(std::string_view hex);
std::optional<address_t> try_make_address(std::string_view hex);
hash32_t make_zero_hash();

/// Left-pad an address into a 32-byte ledger key.
hash32_t make_key(const address_t& address);

/// 32-byte big-endian representation of a 256-bit word.
hash32_t to_word(const uint256_t& value);
uint256_t from_word(const hash32_t& word);

}  // namespace flywheel::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
