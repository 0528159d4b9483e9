#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <timelock/common/critical.hpp>
#include <timelock/schema/encoding/scale/encoder.hpp>
#include <timelock/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace timelock::storage {

namespace detail {

using encoder_t = timelock::schema::encoding::encoder<
    timelock::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline timelock::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const timelock::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<timelock::schema::bytes_t> get(
      const timelock::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const timelock::schema::bytes_view_t& key) const;

  std::optional<committed_state> load_committed_state() const;
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
  std::vector<key_value_entry_t> list_range(
      const timelock::schema::bytes_view_t& first,
      const timelock::schema::bytes_view_t& last) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<timelock::schema::bytes_t>
storage<rocksdb_storage_tag>::get(
    const timelock::schema::bytes_view_t& key) const {
  if (!database) {
    timelock::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    timelock::common::critical("Failed to get value from RocksDB");
  }
  return timelock::schema::bytes_t(std::begin(value), std::end(value));
}

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const timelock::schema::bytes_view_t& key) const {
  auto value = get(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      timelock::schema::bytes_view_t{value->data(), value->size()})};
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    timelock::common::critical("RocksDB database is not initialized");
  }
  auto state = committed_state{};

  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    timelock::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, timelock::schema::hash32_t>>(
          timelock::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    timelock::common::critical("failed to decode committed state");
  }
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());

  return state;
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    timelock::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(timelock::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            timelock::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      timelock::common::critical("failed staging key for commit");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status =
      batch.Put(std::string{detail::kCommittedHeightKey},
                std::string{reinterpret_cast<const char*>(encoded.data()),
                            encoded.size()});
  if (!state_status.ok()) {
    timelock::common::critical("failed staging committed height");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit batch to RocksDB: {}",
                  write_status.ToString());
    timelock::common::critical("failed to commit write batch");
  }
}

inline std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const timelock::schema::bytes_view_t& first,
    const timelock::schema::bytes_view_t& last) const {
  if (!database) {
    timelock::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto upper = detail::to_slice(last);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(detail::to_slice(first));
       iterator->Valid() && iterator->key().compare(upper) <= 0;
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB range scan failed: {}",
                  iterator->status().ToString());
    timelock::common::critical("failed to scan key range");
  }
  return entries;
}

}  // namespace timelock::storage
