#pragma once

#include <notary/execution/value_rail.hpp>
#include <notary/schema/primitives.hpp>
#include <map>
#include <mutex>
#include <set>

namespace notary::execution {

/// In-process native balance book used as the value rail by notaryd and the
/// tests. Accounts marked with `reject` refuse every incoming or outgoing
/// move.
class native_ledger final {
 public:
  void credit(const notary::schema::account_id_t& account,
              const notary::schema::amount_t& amount);
  notary::schema::amount_t balance(
      const notary::schema::account_id_t& account) const;
  bool transfer(const notary::schema::account_id_t& from,
                const notary::schema::account_id_t& to,
                const notary::schema::amount_t& amount);
  void reject(const notary::schema::account_id_t& account);

  balance_reader_t balance_reader();
  value_transfer_t value_transfer();

 private:
  mutable std::mutex mutex_;
  std::map<notary::schema::account_id_t, notary::schema::amount_t> balances_;
  std::set<notary::schema::account_id_t> rejecting_;
};

}  // namespace notary::execution
