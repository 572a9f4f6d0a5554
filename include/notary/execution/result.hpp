#pragma once

#include <notary/execution/context.hpp>
#include <notary/schema/ledger_event_type.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_error_code.hpp>
#include <notary/schema/transaction_result.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace notary::execution {

inline constexpr auto kDeliverCodespace = std::string_view{"notary.deliver"};
inline constexpr auto kCheckCodespace = std::string_view{"notary.checktx"};

/// Failed result: `info` carries the error category name.
notary::schema::transaction_result_t make_error(
    notary::schema::transaction_error_code code,
    std::string log);

notary::schema::transaction_result_t make_success(std::string info = {});

/// Success whose data is the SCALE encoding of `value`.
template <typename T>
notary::schema::transaction_result_t make_success_with(encoder_t& encoder,
                                                       const T& value,
                                                       std::string info = {}) {
  auto result = make_success(std::move(info));
  result.data = encoder.encode(value);
  return result;
}

notary::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    std::string value,
    bool index = false);
notary::schema::transaction_event_attribute_t make_account_attribute(
    std::string key,
    const notary::schema::account_id_t& account);
notary::schema::transaction_event_attribute_t make_id_attribute(std::string key,
                                                                uint64_t id);
notary::schema::transaction_event_attribute_t make_flag_attribute(
    std::string key,
    bool flag);

void emit(execution_context& ctx,
          notary::schema::ledger_event_type_t type,
          std::vector<notary::schema::transaction_event_attribute_t>
              attributes);

}  // namespace notary::execution
