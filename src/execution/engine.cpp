#include <spdlog/spdlog.h>
#include <timelock/blake3/hash.hpp>
#include <timelock/crypto/verify.hpp>
#include <timelock/execution/engine.hpp>
#include <timelock/program/invoke.hpp>
#include <timelock/runtime/addresses.hpp>
#include <timelock/runtime/invoke_context.hpp>
#include <timelock/schema/account.hpp>
#include <timelock/schema/deposit.hpp>
#include <timelock/schema/key/keys.hpp>
#include <timelock/schema/query_error_code.hpp>
#include <timelock/schema/token_account.hpp>
#include <timelock/schema/vault_state.hpp>
#include <algorithm>
#include <iterator>
#include <limits>
#include <tuple>
#include <utility>

using namespace timelock::schema;

namespace {

using encoder_t = timelock::schema::encoding::encoder<
    timelock::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckTxCodespace = std::string_view{"timelock.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"timelock.host"};
constexpr auto kQueryCodespace = std::string_view{"timelock.query"};

timelock::schema::hash32_t fold_state_root(
    const timelock::schema::hash32_t& seed,
    const timelock::schema::bytes_t& tx,
    uint64_t height,
    uint64_t index) {
  auto material = timelock::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return timelock::blake3::hash(
      timelock::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<timelock::schema::transaction_t> decode_transaction(
    encoder_t& encoder,
    const timelock::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode_exact<timelock::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction bytes are not a SCALE envelope";
    return std::nullopt;
  }
  return tx;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string log,
                                       std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::string{error_name(code)};
  result.codespace = std::string{codespace};
  return result;
}

transaction_result_t make_error_result(
    const timelock::runtime::program_error& error) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(error.code);
  result.log = error.log;
  result.info = std::string{error_name(error.code)};
  result.codespace = error.codespace;
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

}  // namespace

namespace timelock::execution {

timelock::schema::hash32_t make_chain_id(std::string_view chain_name) {
  return timelock::blake3::hash(chain_name);
}

timelock::schema::bytes_t make_signing_payload(encoder_t& encoder,
                                               const transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

engine::engine(
    encoder_t& encoder,
    timelock::storage::storage<timelock::storage::rocksdb_storage_tag>& storage,
    std::string_view chain_name,
    bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      pending_state_{[this](const bytes_view_t& key) {
        return storage_.get(key);
      }},
      last_committed_state_root_{make_zero_hash()},
      pending_state_root_{make_zero_hash()},
      chain_id_{make_chain_id(chain_name)},
      require_strict_crypto_{require_strict_crypto} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_) {
    if (!timelock::crypto::available()) {
      timelock::common::critical(
          "ed25519 verification unavailable in this OpenSSL build");
    }
    signature_verifier_ = timelock::crypto::verify_signature;
  } else {
    spdlog::warn("Signature verification disabled; accepting all signatures");
    signature_verifier_ = [](const bytes_view_t&, const account_id_t&,
                             const signature_t&) { return true; };
  }
  load_persisted_state();
  spdlog::info("Execution engine ready for chain '{}' at height {}",
               chain_name, last_committed_height_);
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             decode_error, kCheckTxCodespace);
  }
  auto result =
      validate_transaction(maybe_tx.value(), kCheckTxCodespace, std::nullopt);
  if (result.code == 0) {
    result.gas_wanted = 1000;
  }
  return result;
}

transaction_result_t engine::process_proposal_transaction(
    const bytes_view_t& raw_tx) {
  return check_transaction(raw_tx);
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    std::string_view codespace,
    std::optional<uint64_t> expected_nonce) {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "expected transaction version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "transaction targets a different chain",
                             codespace);
  }
  if (expected_nonce.has_value()) {
    if (tx.nonce != expected_nonce.value()) {
      return make_error_result(
          transaction_error_code::invalid_nonce,
          "expected nonce " + std::to_string(expected_nonce.value()),
          codespace);
    }
  } else if (tx.nonce <= committed_nonce(tx.signer)) {
    return make_error_result(transaction_error_code::invalid_nonce,
                             "nonce already used", codespace);
  }

  auto message = make_signing_payload(encoder_, tx);
  if (!signature_verifier_(bytes_view_t{message.data(), message.size()},
                           tx.signer, tx.signature)) {
    return make_error_result(
        transaction_error_code::signature_verification_failed,
        "signature does not match signer", codespace);
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(
    const transaction_t& tx,
    timestamp_seconds_t block_time) {
  auto context = timelock::runtime::invoke_context{
      encoder_, pending_state_, ledger_, tx.signer, block_time};
  auto scope = timelock::state::transaction_scope{pending_state_};

  auto error = timelock::runtime::program_result_t{};
  std::visit(
      overloaded{
          [&](const allocate_account_t& operation) {
            if (context.load_account(operation.account)) {
              error = timelock::runtime::make_error(
                  transaction_error_code::account_exists,
                  "account " + to_hex(operation.account) + " already exists");
              return;
            }
            auto account = account_t{};
            account.id = operation.account;
            account.owner = operation.owner_program;
            context.store_account(account);
          },
          [&](const open_token_account_t& operation) {
            error = ledger_.open_account(context, operation.account,
                                         operation.mint, operation.owner);
          },
          [&](const mint_tokens_t& operation) {
            error = ledger_.mint_to(context, operation.account,
                                    operation.amount);
          },
          [&](const invoke_vault_t& operation) {
            error = timelock::program::invoke(
                context, timelock::runtime::vault_program_id(),
                operation.accounts,
                bytes_view_t{operation.instruction_data.data(),
                             operation.instruction_data.size()});
          }},
      tx.payload);

  if (error) {
    spdlog::warn("Transaction from {} failed: {} ({})", to_hex(tx.signer),
                 error_name(error->code), error->log);
    return make_error_result(error.value());
  }

  scope.commit();
  auto result = transaction_result_t{};
  result.events = std::move(context.events());
  result.gas_wanted = 1000;
  result.gas_used = 750;
  return result;
}

block_result_t engine::finalize_block(uint64_t height,
                                      timestamp_seconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  pending_state_.clear();
  pending_history_.clear();

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_hash = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto tx_result = transaction_result_t{};
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(
        encoder_, bytes_view_t{txs[i].data(), txs[i].size()}, decode_error);
    if (!maybe_tx) {
      tx_result = make_error_result(transaction_error_code::invalid_transaction,
                                    decode_error, kFinalizeCodespace);
    } else {
      auto next_nonce = pending_nonce(maybe_tx->signer) + 1;
      tx_result =
          validate_transaction(maybe_tx.value(), kFinalizeCodespace, next_nonce);
      if (tx_result.code == 0) {
        // The nonce is consumed even when the payload fails.
        auto nonce_key = key::make_nonce_key(encoder_, maybe_tx->signer);
        pending_state_.store(
            encoder_, bytes_view_t{nonce_key.data(), nonce_key.size()},
            next_nonce);
        tx_result = execute_operation(maybe_tx.value(), block_time);
      }
    }

    auto history_key =
        key::make_history_key(encoder_, height, static_cast<uint32_t>(i));
    auto row = history_entry_t{};
    row.height = height;
    row.index = static_cast<uint32_t>(i);
    row.code = tx_result.code;
    row.tx = txs[i];
    pending_history_.emplace_back(std::move(history_key), encoder_.encode(row));

    if (tx_result.code == 0) {
      rolling_hash = fold_state_root(rolling_hash, txs[i], height, i);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_hash;
  result.state_root = rolling_hash;
  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    auto entries = pending_state_.pending_writes();
    entries.insert(std::end(entries),
                   std::make_move_iterator(std::begin(pending_history_)),
                   std::make_move_iterator(std::end(pending_history_)));
    storage_.commit(entries, timelock::storage::committed_state{
                                 .height = pending_height_,
                                 .state_root = pending_state_root_});
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
    pending_state_.clear();
    pending_history_.clear();
    spdlog::info("Committed block {} ({} write(s))", last_committed_height_,
                 entries.size());
  }

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  if (path == "/engine/info") {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
    result.height = last_committed_height_;
    result.codespace = std::string{kQueryCodespace};
    return result;
  }
  if (path == "/history/range") {
    auto range = encoder_.try_decode_exact<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return make_query_error(query_error_code::invalid_key,
                              "expected (from_height, to_height)", data,
                              last_committed_height_);
    }
    auto rows = load_history(std::get<0>(range.value()),
                             std::get<1>(range.value()));
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = encoder_.encode(rows);
    result.height = last_committed_height_;
    result.codespace = std::string{kQueryCodespace};
    return result;
  }
  return query_state(path, data);
}

query_result_t engine::query_state(std::string_view path,
                                   const bytes_view_t& data) {
  auto committed = timelock::state::overlay{[this](const bytes_view_t& key) {
    return storage_.get(key);
  }};
  auto context = timelock::runtime::invoke_context{
      encoder_, committed, ledger_, make_zero_hash(), 0};

  auto found = [&](bytes_t value) {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = std::move(value);
    result.height = last_committed_height_;
    result.codespace = std::string{kQueryCodespace};
    return result;
  };
  auto missing = [&](std::string log) {
    return make_query_error(query_error_code::not_found, std::move(log), data,
                            last_committed_height_);
  };
  auto load_vault = [&](const account_id_t& id) -> std::optional<vault_state_t> {
    auto account = context.load_account(id);
    if (!account || account->owner != timelock::runtime::vault_program_id()) {
      return std::nullopt;
    }
    return encoder_.try_decode_exact<vault_state_t>(
        bytes_view_t{account->data.data(), account->data.size()});
  };

  if (path == "/state/deposit") {
    auto request =
        encoder_.try_decode_exact<std::tuple<account_id_t, uint64_t>>(data);
    if (!request) {
      return make_query_error(query_error_code::invalid_key,
                              "expected (vault id, deposit id)", data,
                              last_committed_height_);
    }
    auto vault = load_vault(std::get<0>(request.value()));
    if (!vault) {
      return missing("vault not found");
    }
    auto it = std::find_if(
        std::begin(vault->deposits), std::end(vault->deposits),
        [&](const deposit_t& deposit) {
          return deposit.id == std::get<1>(request.value());
        });
    if (it == std::end(vault->deposits)) {
      return missing("deposit not found");
    }
    return found(encoder_.encode(*it));
  }

  auto is_account_path = path == "/state/account" || path == "/state/vault" ||
                         path == "/state/token_account" ||
                         path == "/vault/authority";
  if (!is_account_path) {
    return make_query_error(query_error_code::unsupported_path,
                            "unsupported query path", data,
                            last_committed_height_);
  }
  auto id = try_make_hash32(data);
  if (!id) {
    return make_query_error(query_error_code::invalid_key,
                            "expected 32-byte account id", data,
                            last_committed_height_);
  }

  if (path == "/vault/authority") {
    auto authority = timelock::runtime::vault_authority(id.value());
    return found(bytes_t{std::begin(authority), std::end(authority)});
  }
  if (path == "/state/account") {
    auto account = context.load_account(id.value());
    if (!account) {
      return missing("account not found");
    }
    return found(encoder_.encode(account.value()));
  }
  if (path == "/state/vault") {
    auto vault = load_vault(id.value());
    if (!vault) {
      return missing("vault not found");
    }
    return found(encoder_.encode(vault.value()));
  }
  auto balance = ledger_.read_balance(context, id.value());
  if (!balance) {
    return missing("token account not found");
  }
  return found(encoder_.encode(balance.value()));
}

std::vector<history_entry_t> engine::history(uint64_t from_height,
                                             uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return load_history(from_height, to_height);
}

std::vector<history_entry_t> engine::load_history(uint64_t from_height,
                                                  uint64_t to_height) const {
  auto rows = std::vector<history_entry_t>{};
  if (from_height > to_height) {
    return rows;
  }
  auto first = key::make_history_key(encoder_, from_height, 0);
  auto last = key::make_history_key(encoder_, to_height,
                                    std::numeric_limits<uint32_t>::max());
  for (const auto& [row_key, value] :
       storage_.list_range(bytes_view_t{first.data(), first.size()},
                           bytes_view_t{last.data(), last.size()})) {
    if (!key::parse_history_key(
            encoder_, bytes_view_t{row_key.data(), row_key.size()})) {
      continue;
    }
    rows.push_back(encoder_.decode<history_entry_t>(
        bytes_view_t{value.data(), value.size()}));
  }
  return rows;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::warn("Ignoring signature verifier override in insecure mode");
    return;
  }
  signature_verifier_ = std::move(verifier);
  signature_verifier_overridden_ = true;
}

void engine::set_transfer_hook(timelock::ledger::transfer_hook_t hook) {
  auto lock = std::scoped_lock{mutex_};
  ledger_.set_transfer_hook(std::move(hook));
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

uint64_t engine::committed_nonce(const account_id_t& signer) const {
  auto nonce_key = key::make_nonce_key(encoder_, signer);
  return storage_
      .get<encoder_t, uint64_t>(
          encoder_, bytes_view_t{nonce_key.data(), nonce_key.size()})
      .value_or(0);
}

uint64_t engine::pending_nonce(const account_id_t& signer) const {
  auto nonce_key = key::make_nonce_key(encoder_, signer);
  return pending_state_
      .try_load<encoder_t, uint64_t>(
          encoder_, bytes_view_t{nonce_key.data(), nonce_key.size()})
      .value_or(0);
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_state_root_ = committed->state_root;
  }
}

}  // namespace timelock::execution
