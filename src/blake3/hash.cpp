#include <blake3.h>
#include <flywheel/blake3/hash.hpp>

namespace flywheel::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  hasher& update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
    return *this;
  }

  flywheel::schema::hash32_t finalize() {
    auto output = flywheel::schema::hash32_t{};
    static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<decltype(output)>);
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

flywheel::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str.data(), str.size()).finalize();
}

flywheel::schema::hash32_t hash(const flywheel::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes.data(), bytes.size()).finalize();
}

flywheel::schema::hash32_t hash(const std::string_view& domain,
                                const flywheel::schema::bytes_view_t& bytes) {
  return hasher{}
      .update(domain.data(), domain.size())
      .update(bytes.data(), bytes.size())
      .finalize();
}

}  // namespace flywheel::blake3
