#pragma once

#include <timelock/schema/primitives.hpp>
#include <timelock/storage/storage.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace timelock::state {

/// Fallback lookup for keys the overlay has not written.
using read_through_t = std::function<std::optional<timelock::schema::bytes_t>(
    const timelock::schema::bytes_view_t&)>;

/// Journaled write layer over committed storage.
///
/// Writes are kept in memory until the owner flushes `pending_writes()`.
/// `checkpoint()` opens a nested transaction, `commit()` folds it into its
/// parent and `revert()` restores every key written since the matching
/// checkpoint.
class overlay final {
 public:
  explicit overlay(read_through_t read_through = {});

  std::optional<timelock::schema::bytes_t> get(
      const timelock::schema::bytes_view_t& key) const;
  bool contains(const timelock::schema::bytes_view_t& key) const;
  void put(const timelock::schema::bytes_view_t& key,
           timelock::schema::bytes_t value);

  template <typename Encoder, typename T>
  std::optional<T> try_load(Encoder& encoder,
                            const timelock::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void store(Encoder& encoder,
             const timelock::schema::bytes_view_t& key,
             const T& value);

  void checkpoint();
  void commit();
  void revert();
  std::size_t depth() const;

  /// Writes not yet flushed, in key order.
  std::vector<timelock::storage::key_value_entry_t> pending_writes() const;

  /// Drop every write and checkpoint. Used after a flush or a discarded block.
  void clear();

 private:
  struct journal_entry final {
    timelock::schema::bytes_t key;
    std::optional<timelock::schema::bytes_t> previous;
  };

  read_through_t read_through_;
  std::map<timelock::schema::bytes_t, timelock::schema::bytes_t> writes_;
  std::vector<journal_entry> journal_;
  std::vector<std::size_t> checkpoints_;
};

/// Checkpoints on construction and reverts on destruction unless committed.
class transaction_scope final {
 public:
  explicit transaction_scope(overlay& state);
  ~transaction_scope();

  transaction_scope(const transaction_scope&) = delete;
  transaction_scope& operator=(const transaction_scope&) = delete;

  void commit();

 private:
  overlay& state_;
  bool committed_{false};
};

template <typename Encoder, typename T>
std::optional<T> overlay::try_load(
    Encoder& encoder,
    const timelock::schema::bytes_view_t& key) const {
  auto value = get(key);
  if (!value) {
    return std::nullopt;
  }
  return encoder.template try_decode<T>(
      timelock::schema::bytes_view_t{value->data(), value->size()});
}

template <typename Encoder, typename T>
void overlay::store(Encoder& encoder,
                    const timelock::schema::bytes_view_t& key,
                    const T& value) {
  put(key, encoder.encode(value));
}

}  // namespace timelock::state
