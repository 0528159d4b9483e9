#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace timelock::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
// Account identities are ed25519 public keys or program derived addresses.
using account_id_t = hash32_t;
using amount_t = uint64_t;
using timestamp_seconds_t = int64_t;
using tag_t = std::array<uint8_t, 32>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using signature_t = ed25519_signature_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Left-aligned, zero padded label. Longer input is truncated.
tag_t make_tag(const std::string_view& label);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(const std::string_view encoded);
bytes_t from_base64(const std::string_view encoded);

}  // namespace timelock::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
