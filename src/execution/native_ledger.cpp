#include <spdlog/spdlog.h>
#include <notary/execution/native_ledger.hpp>

namespace notary::execution {

void native_ledger::credit(const notary::schema::account_id_t& account,
                           const notary::schema::amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  balances_[account] += amount;
}

notary::schema::amount_t native_ledger::balance(
    const notary::schema::account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = balances_.find(account);
  if (it == std::end(balances_)) {
    return notary::schema::amount_t{0};
  }
  return it->second;
}

bool native_ledger::transfer(const notary::schema::account_id_t& from,
                             const notary::schema::account_id_t& to,
                             const notary::schema::amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  if (rejecting_.contains(from) || rejecting_.contains(to)) {
    spdlog::debug("Native transfer rejected by account policy");
    return false;
  }
  auto& source = balances_[from];
  if (source < amount) {
    spdlog::debug("Native transfer rejected: insufficient balance");
    return false;
  }
  source -= amount;
  balances_[to] += amount;
  return true;
}

void native_ledger::reject(const notary::schema::account_id_t& account) {
  auto lock = std::scoped_lock{mutex_};
  rejecting_.insert(account);
}

balance_reader_t native_ledger::balance_reader() {
  return [this](const notary::schema::account_id_t& account) {
    return balance(account);
  };
}

value_transfer_t native_ledger::value_transfer() {
  return [this](const notary::schema::account_id_t& from,
                const notary::schema::account_id_t& to,
                const notary::schema::amount_t& amount) {
    return transfer(from, to, amount);
  };
}

}  // namespace notary::execution
