#pragma once
#include <timelock/schema/primitives.hpp>
#include <cstdint>

// Schema type: account.
// Host workflow: storage slot record. `owner` is the program allowed to write
// `data`; an allocated but uninitialised slot has empty data.
namespace timelock::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  account_id_t id{};
  account_id_t owner{};
  bytes_t data;
};

using account_t = account<1>;

}  // namespace timelock::schema
