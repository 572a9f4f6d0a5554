#pragma once

#include <notary/schema/primitives.hpp>
#include <functional>

namespace notary::execution {

/// Environment-held native balance of an account.
using balance_reader_t =
    std::function<notary::schema::amount_t(const notary::schema::account_id_t&)>;

/// Move native value between accounts. Returns false when the environment
/// rejects the move; the engine then fails the transaction.
using value_transfer_t =
    std::function<bool(const notary::schema::account_id_t& from,
                       const notary::schema::account_id_t& to,
                       const notary::schema::amount_t& amount)>;

struct value_rail final {
  balance_reader_t balance;
  value_transfer_t transfer;
};

}  // namespace notary::execution
