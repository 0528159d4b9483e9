#pragma once
#include <timelock/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace timelock::blake3 {

timelock::schema::hash32_t hash(const std::string_view& str);
timelock::schema::hash32_t hash(const timelock::schema::bytes_view_t& bytes);

/// Hash the concatenation of `parts` without building a joined buffer.
timelock::schema::hash32_t hash(
    std::initializer_list<timelock::schema::bytes_view_t> parts);

}  // namespace timelock::blake3
