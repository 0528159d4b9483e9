#pragma once
#include <timelock/schema/primitives.hpp>
#include <cstdint>

// Schema type: mint tokens.
// Ledger workflow: credits a token account; the signer must be the mint.
namespace timelock::schema {

template <uint16_t Version>
struct mint_tokens;

template <>
struct mint_tokens<1> final {
  uint16_t version{1};
  account_id_t account{};
  amount_t amount{};
};

using mint_tokens_t = mint_tokens<1>;

}  // namespace timelock::schema
