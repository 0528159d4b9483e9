#pragma once
#include <timelock/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace timelock::storage {

using key_value_entry_t =
    std::pair<timelock::schema::bytes_t, timelock::schema::bytes_t>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  timelock::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Return the raw value at key, or std::nullopt when missing.
  std::optional<timelock::schema::bytes_t> get(
      const timelock::schema::bytes_view_t& key) const;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const timelock::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically persist `entries` together with the committed checkpoint.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;

  /// Return key-value pairs with first <= key <= last in key order.
  std::vector<key_value_entry_t> list_range(
      const timelock::schema::bytes_view_t& first,
      const timelock::schema::bytes_view_t& last) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace timelock::storage
