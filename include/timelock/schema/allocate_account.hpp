#pragma once
#include <timelock/schema/primitives.hpp>
#include <cstdint>

// Schema type: allocate account.
// Host workflow: reserves an empty storage slot and assigns it to a program.
namespace timelock::schema {

template <uint16_t Version>
struct allocate_account;

template <>
struct allocate_account<1> final {
  uint16_t version{1};
  account_id_t account{};
  account_id_t owner_program{};
};

using allocate_account_t = allocate_account<1>;

}  // namespace timelock::schema
