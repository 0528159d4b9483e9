#include <timelock/blake3/hash.hpp>
#include <timelock/runtime/addresses.hpp>
#include <timelock/schema/encoding/scale/encoder.hpp>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = timelock::schema::encoding::encoder<
    timelock::schema::encoding::scale_encoder_tag>;

constexpr auto kDerivedAddressMarker =
    std::string_view{"timelock|program-derived-address"};

}  // namespace

namespace timelock::runtime {

const timelock::schema::account_id_t& system_program_id() {
  static const auto id = timelock::schema::make_zero_hash();
  return id;
}

const timelock::schema::account_id_t& vault_program_id() {
  static const auto id = timelock::blake3::hash(
      std::string_view{"timelock|program|vault"});
  return id;
}

const timelock::schema::account_id_t& token_program_id() {
  static const auto id = timelock::blake3::hash(
      std::string_view{"timelock|program|token"});
  return id;
}

const timelock::schema::account_id_t& clock_sysvar_id() {
  static const auto id = timelock::blake3::hash(
      std::string_view{"timelock|sysvar|clock"});
  return id;
}

timelock::schema::account_id_t derive_program_address(
    const timelock::schema::account_id_t& program_id,
    const seeds_t& seeds) {
  // Seeds are length prefixed so {"ab", "c"} and {"a", "bc"} differ.
  auto encoder = encoder_t{};
  auto material = encoder.encode(seeds);
  material.insert(std::end(material), std::begin(program_id),
                  std::end(program_id));
  auto marker = timelock::schema::make_bytes_view(kDerivedAddressMarker);
  material.insert(std::end(material), std::begin(marker), std::end(marker));
  return timelock::blake3::hash(
      timelock::schema::bytes_view_t{material.data(), material.size()});
}

seeds_t vault_authority_seeds(const timelock::schema::account_id_t& vault) {
  return seeds_t{timelock::schema::bytes_t{std::begin(vault), std::end(vault)},
                 timelock::schema::bytes_t{0}};
}

timelock::schema::account_id_t vault_authority(
    const timelock::schema::account_id_t& vault) {
  return derive_program_address(vault_program_id(),
                                vault_authority_seeds(vault));
}

}  // namespace timelock::runtime
