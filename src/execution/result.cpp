#include <notary/execution/result.hpp>
#include <utility>

namespace notary::execution {

notary::schema::transaction_result_t make_error(
    const notary::schema::transaction_error_code code,
    std::string log) {
  auto result = notary::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info =
      std::string{notary::schema::to_string(notary::schema::category_of(code))};
  return result;
}

notary::schema::transaction_result_t make_success(std::string info) {
  auto result = notary::schema::transaction_result_t{};
  result.info = std::move(info);
  return result;
}

notary::schema::transaction_event_attribute_t make_attribute(std::string key,
                                                             std::string value,
                                                             const bool index) {
  auto attribute = notary::schema::transaction_event_attribute_t{};
  attribute.key = std::move(key);
  attribute.value = std::move(value);
  attribute.index = index;
  return attribute;
}

notary::schema::transaction_event_attribute_t make_account_attribute(
    std::string key,
    const notary::schema::account_id_t& account) {
  return make_attribute(std::move(key), notary::schema::to_hex(account), true);
}

notary::schema::transaction_event_attribute_t make_id_attribute(
    std::string key,
    const uint64_t id) {
  return make_attribute(std::move(key), std::to_string(id), true);
}

notary::schema::transaction_event_attribute_t make_flag_attribute(
    std::string key,
    const bool flag) {
  return make_attribute(std::move(key), std::string{flag ? "true" : "false"},
                        false);
}

void emit(execution_context& ctx,
          const notary::schema::ledger_event_type_t type,
          std::vector<notary::schema::transaction_event_attribute_t>
              attributes) {
  ctx.events.push_back(
      pending_event{.type = type, .attributes = std::move(attributes)});
}

}  // namespace notary::execution
