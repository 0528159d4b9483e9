#pragma once

#include <timelock/execution/engine.hpp>
#include <timelock/schema/primitives.hpp>
#include <timelock/storage/rocksdb/storage.hpp>
#include <timelock/testing/common.hpp>
#include <timelock/testing/execution_harness.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace timelock::testing {

class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const bool strict_crypto = true)
      : db_path_{make_db_path(db_prefix)}, strict_crypto_{strict_crypto} {
    open();
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() {
    engine_.reset();
    storage_.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  timelock::storage::storage<timelock::storage::rocksdb_storage_tag>&
  storage() {
    return *storage_;
  }

  timelock::execution::engine& engine() { return *engine_; }

  timelock::schema::hash32_t chain_id() { return engine_->chain_id(); }

  /// Close the database and start a fresh engine on the same directory.
  void restart() {
    engine_.reset();
    storage_.reset();
    open();
  }

 private:
  void open() {
    storage_.emplace(timelock::storage::make_storage<
                     timelock::storage::rocksdb_storage_tag>(db_path_));
    engine_.emplace(encoder_, *storage_,
                    timelock::execution::kDefaultChainName, strict_crypto_);
  }

  std::string db_path_;
  bool strict_crypto_{true};
  scale_encoder_t encoder_;
  std::optional<
      timelock::storage::storage<timelock::storage::rocksdb_storage_tag>>
      storage_;
  std::optional<timelock::execution::engine> engine_;
};

}  // namespace timelock::testing
