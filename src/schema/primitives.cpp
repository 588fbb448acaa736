#include <algorithm>
#include <iterator>
#include <string_view>
#include <tranche/blake3/hash.hpp>
#include <tranche/schema/primitives.hpp>

namespace tranche::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

// Key material is tagged so an ed25519 and a secp256k1 key with colliding
// bytes never resolve to the same account.
constexpr uint8_t kEd25519AccountTag = 0;
constexpr uint8_t kSecp256k1AccountTag = 1;

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto digits = normalize_hex(hex);
  auto hash = hash32_t{};
  if (digits.size() != hash.size() * 2) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < hash.size(); ++i) {
    auto high = hex_nibble(digits[2 * i]);
    auto low = hex_nibble(digits[(2 * i) + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    hash[i] = static_cast<uint8_t>((*high << 4u) | *low);
  }
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

account_id_t make_account_id(const signer_id_t& signer) {
  return std::visit(
      overloaded{[](const ed25519_signer_id& value) {
                   auto tag = std::array{kEd25519AccountTag};
                   return tranche::blake3::hash(
                       {bytes_view_t{tag}, bytes_view_t{value.public_key}});
                 },
                 [](const secp256k1_signer_id& value) {
                   auto tag = std::array{kSecp256k1AccountTag};
                   return tranche::blake3::hash(
                       {bytes_view_t{tag}, bytes_view_t{value.public_key}});
                 },
                 [](const named_signer_t& value) { return value; }},
      signer);
}

bool is_null_account(const account_id_t& account) {
  return std::all_of(std::begin(account), std::end(account),
                     [](const uint8_t byte) { return byte == 0; });
}

bytes_t encode_uint256(const amount_t& value) {
  auto out = bytes_t(32, 0);
  auto remaining = value;
  for (auto i = out.size(); i > 0; --i) {
    out[i - 1] = static_cast<uint8_t>(remaining & 0xFFu);
    remaining >>= 8;
  }
  return out;
}

std::optional<amount_t> decode_uint256(const bytes_view_t& bytes) {
  if (bytes.size() != 32) {
    return std::nullopt;
  }
  auto value = amount_t{};
  for (const auto byte : bytes) {
    value <<= 8;
    value |= byte;
  }
  return value;
}

}  // namespace tranche::schema
