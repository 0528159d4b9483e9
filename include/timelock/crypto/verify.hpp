#pragma once

#include <timelock/schema/primitives.hpp>

#include <array>
#include <optional>

namespace timelock::crypto {

using ed25519_seed_t = std::array<uint8_t, 32>;

bool available();

bool verify_signature(const timelock::schema::bytes_view_t& message,
                      const timelock::schema::account_id_t& signer,
                      const timelock::schema::signature_t& signature);

/// Public key (account id) for a raw ed25519 private key seed.
std::optional<timelock::schema::account_id_t> public_key_from_seed(
    const ed25519_seed_t& seed);

std::optional<timelock::schema::signature_t> sign(
    const timelock::schema::bytes_view_t& message,
    const ed25519_seed_t& seed);

}  // namespace timelock::crypto
