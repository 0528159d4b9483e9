#include <boost/program_options.hpp>
#include <timelock/common/critical.hpp>
#include <timelock/crypto/verify.hpp>
#include <timelock/execution/engine.hpp>
#include <timelock/runtime/addresses.hpp>
#include <timelock/schema/encoding/scale/encoder.hpp>
#include <timelock/schema/transaction.hpp>
#include <timelock/schema/vault_instruction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = timelock::schema::encoding::encoder<
    timelock::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

timelock::schema::hash32_t get_hash32(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    timelock::common::critical("missing required hash argument --" + name);
  }
  auto hash = timelock::schema::try_make_hash32(
      std::string_view{vm[name].as<std::string>()});
  if (!hash) {
    timelock::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return hash.value();
}

std::vector<timelock::schema::account_id_t> get_accounts(
    const po::variables_map& vm) {
  auto accounts = std::vector<timelock::schema::account_id_t>{};
  if (!vm.contains("account")) {
    return accounts;
  }
  for (const auto& value : vm["account"].as<std::vector<std::string>>()) {
    auto hash = timelock::schema::try_make_hash32(std::string_view{value});
    if (!hash) {
      timelock::common::critical("--account must be 32 bytes of hex");
    }
    accounts.push_back(hash.value());
  }
  return accounts;
}

timelock::schema::tag_t get_tag(const po::variables_map& vm) {
  if (!vm.contains("tag")) {
    return timelock::schema::tag_t{};
  }
  return timelock::schema::make_tag(vm["tag"].as<std::string>());
}

timelock::schema::bytes_t build_instruction(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto instruction = vm["instruction"].as<std::string>();
  if (instruction == "create_vault") {
    return encoder.encode(timelock::schema::vault_instruction_t{
        timelock::schema::create_vault_t{}});
  }
  if (instruction == "deposit") {
    return encoder.encode(timelock::schema::vault_instruction_t{
        timelock::schema::deposit_tokens_t{
            .amount = vm["amount"].as<uint64_t>(),
            .unlock_time = vm["unlock-time"].as<int64_t>(),
            .tag = get_tag(vm)}});
  }
  if (instruction == "withdraw") {
    return encoder.encode(timelock::schema::vault_instruction_t{
        timelock::schema::withdraw_t{.deposit_id =
                                         vm["deposit-id"].as<uint64_t>()}});
  }
  if (instruction == "emergency_withdraw") {
    return encoder.encode(timelock::schema::vault_instruction_t{
        timelock::schema::emergency_withdraw_t{
            .deposit_id = vm["deposit-id"].as<uint64_t>()}});
  }
  timelock::common::critical(
      "instruction must be create_vault|deposit|withdraw|emergency_withdraw");
}

timelock::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "allocate_account") {
    auto owner_program = timelock::runtime::vault_program_id();
    if (vm.contains("owner-program")) {
      owner_program = get_hash32(vm, "owner-program");
    }
    return timelock::schema::allocate_account_t{
        .account = get_hash32(vm, "account-id"),
        .owner_program = owner_program};
  }
  if (payload == "open_token_account") {
    return timelock::schema::open_token_account_t{
        .account = get_hash32(vm, "account-id"),
        .mint = get_hash32(vm, "mint"),
        .owner = get_hash32(vm, "owner")};
  }
  if (payload == "mint_tokens") {
    return timelock::schema::mint_tokens_t{
        .account = get_hash32(vm, "account-id"),
        .amount = vm["amount"].as<uint64_t>()};
  }
  if (payload == "invoke_vault") {
    if (!vm.contains("instruction")) {
      timelock::common::critical("invoke_vault requires --instruction");
    }
    return timelock::schema::invoke_vault_t{
        .accounts = get_accounts(vm), .instruction_data = build_instruction(vm)};
  }
  timelock::common::critical(
      "payload must be "
      "allocate_account|open_token_account|mint_tokens|invoke_vault");
}

timelock::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info") {
    return {};
  }
  if (path == "/state/account" || path == "/state/vault" ||
      path == "/state/token_account" || path == "/vault/authority") {
    auto hash = get_hash32(vm, "account-id");
    return timelock::schema::bytes_t{std::begin(hash), std::end(hash)};
  }
  if (path == "/state/deposit") {
    return encoder.encode(std::tuple{get_hash32(vm, "account-id"),
                                     vm["deposit-id"].as<uint64_t>()});
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  timelock::common::critical("unsupported query path");
}

void print_encoded(const timelock::schema::bytes_t& bytes) {
  std::cout << "hex:    " << timelock::schema::to_hex(bytes) << '\n'
            << "base64: " << timelock::schema::to_base64(bytes) << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  timelock_transaction_builder transaction [options]\n"
            << "  timelock_transaction_builder instruction [options]\n"
            << "  timelock_transaction_builder query-key [options]\n"
            << "  timelock_transaction_builder public-key --seed <hex>\n"
            << "  timelock_transaction_builder vault-authority --account-id "
               "<hex>\n"
            << "  timelock_transaction_builder program-ids\n"
            << "  timelock_transaction_builder chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"timelock_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|instruction|query-key|public-key|vault-authority|"
      "program-ids|chain-id")(
      "payload", po::value<std::string>(),
      "allocate_account|open_token_account|mint_tokens|invoke_vault")(
      "instruction", po::value<std::string>(),
      "create_vault|deposit|withdraw|emergency_withdraw")(
      "path", po::value<std::string>(), "abci query path")(
      "chain-name",
      po::value<std::string>()->default_value(
          std::string{timelock::execution::kDefaultChainName}),
      "chain name hashed into the chain id")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "seed", po::value<std::string>(),
      "ed25519 private key seed hex; signs the transaction")(
      "signer", po::value<std::string>(),
      "signer public key hex when no --seed is given")(
      "signature-hex", po::value<std::string>()->default_value(""),
      "precomputed signature hex when no --seed is given")(
      "account-id", po::value<std::string>(), "target account hash32 hex")(
      "owner-program", po::value<std::string>(),
      "program id owning an allocated account (default: vault program)")(
      "mint", po::value<std::string>(), "token mint hash32 hex")(
      "owner", po::value<std::string>(), "token account owner hash32 hex")(
      "account", po::value<std::vector<std::string>>()->multitoken(),
      "positional vault accounts in instruction order")(
      "amount", po::value<uint64_t>()->default_value(0), "token amount")(
      "unlock-time", po::value<int64_t>()->default_value(0),
      "deposit unlock time (unix seconds)")(
      "tag", po::value<std::string>(), "deposit label, up to 32 bytes")(
      "deposit-id", po::value<uint64_t>()->default_value(0), "deposit id")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "history range from")(
      "to-height", po::value<uint64_t>()->default_value(1), "history range to");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};
  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      timelock::common::critical("transaction mode requires --payload");
    }
    auto transaction = timelock::schema::transaction_t{
        .version = 1,
        .chain_id = timelock::execution::make_chain_id(
            vm["chain-name"].as<std::string>()),
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = {},
        .payload = build_payload(vm),
        .signature = {}};

    if (vm.contains("seed")) {
      auto seed = get_hash32(vm, "seed");
      auto signer = timelock::crypto::public_key_from_seed(seed);
      if (!signer) {
        timelock::common::critical("invalid ed25519 seed");
      }
      transaction.signer = signer.value();
      auto message =
          timelock::execution::make_signing_payload(encoder, transaction);
      auto signature = timelock::crypto::sign(
          timelock::schema::bytes_view_t{message.data(), message.size()},
          seed);
      if (!signature) {
        timelock::common::critical("failed to sign transaction");
      }
      transaction.signature = signature.value();
    } else {
      transaction.signer = get_hash32(vm, "signer");
      auto raw = vm["signature-hex"].as<std::string>();
      if (!raw.empty()) {
        auto bytes = timelock::schema::try_from_hex(raw);
        if (!bytes || bytes->size() != transaction.signature.size()) {
          timelock::common::critical("ed25519 signature must be 64 bytes");
        }
        std::copy(std::begin(*bytes), std::end(*bytes),
                  std::begin(transaction.signature));
      }
    }
    print_encoded(encoder.encode(transaction));
    return 0;
  }

  if (command == "instruction") {
    if (!vm.contains("instruction")) {
      timelock::common::critical("instruction mode requires --instruction");
    }
    print_encoded(build_instruction(vm));
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      timelock::common::critical("query-key mode requires --path");
    }
    print_encoded(build_query_key(vm));
    return 0;
  }

  if (command == "public-key") {
    auto key = timelock::crypto::public_key_from_seed(get_hash32(vm, "seed"));
    if (!key) {
      timelock::common::critical("invalid ed25519 seed");
    }
    std::cout << timelock::schema::to_hex(key.value()) << '\n';
    return 0;
  }

  if (command == "vault-authority") {
    auto authority =
        timelock::runtime::vault_authority(get_hash32(vm, "account-id"));
    std::cout << timelock::schema::to_hex(authority) << '\n';
    return 0;
  }

  if (command == "program-ids") {
    std::cout << "system: "
              << timelock::schema::to_hex(timelock::runtime::system_program_id())
              << '\n'
              << "vault:  "
              << timelock::schema::to_hex(timelock::runtime::vault_program_id())
              << '\n'
              << "token:  "
              << timelock::schema::to_hex(timelock::runtime::token_program_id())
              << '\n'
              << "clock:  "
              << timelock::schema::to_hex(timelock::runtime::clock_sysvar_id())
              << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << timelock::schema::to_hex(timelock::execution::make_chain_id(
                     vm["chain-name"].as<std::string>()))
              << '\n';
    return 0;
  }

  timelock::common::critical(
      "command must be "
      "transaction|instruction|query-key|public-key|vault-authority|"
      "program-ids|chain-id");
}
