#include <blake3.h>
#include <tranche/blake3/hash.hpp>

namespace tranche::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  hasher& update(const void* data, const size_t size) {
    blake3_hasher_update(&state_, data, size);
    return *this;
  }

  tranche::schema::hash32_t finalize() {
    static_assert(BLAKE3_OUT_LEN == sizeof(tranche::schema::hash32_t));
    auto output = tranche::schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

tranche::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str.data(), str.size()).finalize();
}

tranche::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes.data(), bytes.size()).finalize();
}

tranche::schema::hash32_t hash(
    std::initializer_list<std::span<const uint8_t>> parts) {
  auto state = hasher{};
  for (const auto& part : parts) {
    state.update(part.data(), part.size());
  }
  return state.finalize();
}

}  // namespace tranche::blake3
