#pragma once
#include <timelock/common/critical.hpp>
#include <timelock/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace timelock::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  timelock::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, timelock::schema::bytes_t& out);

  template <typename T>
  T decode(const timelock::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const timelock::schema::bytes_view_t& bytes);

  /// Decode and require that every input byte was consumed.
  template <typename T>
  std::optional<T> try_decode_exact(const timelock::schema::bytes_view_t& bytes);
};

template <typename T>
timelock::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    timelock::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        timelock::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const timelock::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    timelock::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const timelock::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode_exact(
    const timelock::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  // SCALE is canonical for the types we accept, so a value that re-encodes
  // shorter than its input had trailing bytes.
  if (encode(decoded.value()).size() != bytes.size()) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace timelock::schema::encoding
