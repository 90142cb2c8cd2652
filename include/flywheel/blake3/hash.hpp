#pragma once
#include <flywheel/schema/primitives.hpp>
#include <string_view>

namespace flywheel::blake3 {

flywheel::schema::hash32_t hash(const std::string_view& str);
flywheel::schema::hash32_t hash(const flywheel::schema::bytes_view_t& bytes);

/// Domain-separated hash: the domain tag is absorbed ahead of the payload.
flywheel::schema::hash32_t hash(const std::string_view& domain,
                                const flywheel::schema::bytes_view_t& bytes);

}  // namespace flywheel::blake3
