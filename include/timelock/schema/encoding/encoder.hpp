#pragma once
#include <timelock/schema/primitives.hpp>
#include <optional>
#include <span>

namespace timelock::schema::encoding {

// The concrete codec is a build time choice selected by tag. Everything that
// touches persisted or wire bytes goes through this facade so the library
// behind it stays in one place.
template <typename Library>
struct encoder {
  template <typename T>
  timelock::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, timelock::schema::bytes_t& out);

  template <typename T>
  T decode(const timelock::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const timelock::schema::bytes_view_t& bytes);
};

}  // namespace timelock::schema::encoding
