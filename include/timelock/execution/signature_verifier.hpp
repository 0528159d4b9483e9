#pragma once

#include <timelock/schema/primitives.hpp>
#include <functional>

namespace timelock::execution {

using signature_verifier_t =
    std::function<bool(const timelock::schema::bytes_view_t& message,
                       const timelock::schema::account_id_t& signer,
                       const timelock::schema::signature_t& signature)>;

}  // namespace timelock::execution
