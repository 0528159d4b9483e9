#pragma once

#include <boost/endian/buffers.hpp>
#include <timelock/schema/primitives.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for host accounts, signer nonces and
// transaction history.
namespace timelock::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};

inline const std::array<std::string_view, 4> kEngineKeyspaces{
    kStatePrefix, kNonceKeyPrefix, kAccountKeyPrefix, kHistoryPrefix};

template <typename Encoder, typename T>
timelock::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
timelock::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
timelock::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const timelock::schema::account_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
timelock::schema::bytes_t make_account_key(
    Encoder& encoder,
    const timelock::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, account);
}

// History rows are keyed by the SCALE prefix followed by a big-endian
// (height, index), so byte order is block order and a height range is one
// contiguous key range.
template <typename Encoder>
timelock::schema::bytes_t make_history_key(Encoder& encoder,
                                           uint64_t height,
                                           uint32_t index) {
  auto key = make_prefix_key(encoder, kHistoryPrefix);
  auto height_buffer = boost::endian::big_uint64_buf_t{height};
  auto index_buffer = boost::endian::big_uint32_buf_t{index};
  key.insert(std::end(key), height_buffer.data(),
             height_buffer.data() + sizeof(height_buffer));
  key.insert(std::end(key), index_buffer.data(),
             index_buffer.data() + sizeof(index_buffer));
  return key;
}

template <typename Encoder>
std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    Encoder& encoder,
    const timelock::schema::bytes_view_t& key) {
  auto prefix = make_prefix_key(encoder, kHistoryPrefix);
  auto height_buffer = boost::endian::big_uint64_buf_t{};
  auto index_buffer = boost::endian::big_uint32_buf_t{};
  if (key.size() !=
      prefix.size() + sizeof(height_buffer) + sizeof(index_buffer)) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  auto position = key.data() + prefix.size();
  std::memcpy(height_buffer.data(), position, sizeof(height_buffer));
  std::memcpy(index_buffer.data(), position + sizeof(height_buffer),
              sizeof(index_buffer));
  return std::pair<uint64_t, uint32_t>{height_buffer.value(),
                                       index_buffer.value()};
}

}  // namespace timelock::schema::key
