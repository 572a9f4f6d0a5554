#include <boost/program_options.hpp>
#include <notary/blake3/hash.hpp>
#include <notary/common/critical.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/role_id.hpp>
#include <notary/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

notary::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  if (!vm.contains(name)) {
    notary::common::critical("missing required hash argument");
  }
  return notary::schema::make_hash32(vm[name].as<std::string>());
}

notary::schema::amount_t get_amount(const po::variables_map& vm,
                                    const std::string& name) {
  auto amount =
      notary::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    notary::common::critical("amount must be a decimal uint256");
  }
  return *amount;
}

notary::schema::role_id_t get_role(const po::variables_map& vm) {
  auto role = notary::schema::try_from_string<notary::schema::role_id_t>(
      vm["role"].as<std::string>());
  if (!role) {
    notary::common::critical("role must be admin|curator");
  }
  return *role;
}

notary::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "grant_role") {
    return notary::schema::grant_role_t{.account = get_hash32(vm, "account"),
                                        .role = get_role(vm)};
  }
  if (payload == "revoke_role") {
    return notary::schema::revoke_role_t{.account = get_hash32(vm, "account"),
                                         .role = get_role(vm)};
  }
  if (payload == "transfer_ownership") {
    return notary::schema::transfer_ownership_t{
        .new_owner = get_hash32(vm, "account")};
  }
  if (payload == "register_item") {
    return notary::schema::register_item_t{
        .uri = vm["uri"].as<std::string>(),
        .category = vm["category"].as<std::string>()};
  }
  if (payload == "moderate_item") {
    return notary::schema::moderate_item_t{
        .item_id = vm["item-id"].as<uint64_t>(),
        .verified = vm["verified"].as<bool>(),
        .active = vm["active"].as<bool>()};
  }
  if (payload == "deactivate_item") {
    return notary::schema::deactivate_item_t{
        .item_id = vm["item-id"].as<uint64_t>()};
  }
  if (payload == "create_document") {
    auto signers = std::vector<notary::schema::account_id_t>{};
    if (vm.contains("required-signer")) {
      for (const auto& value :
           vm["required-signer"].as<std::vector<std::string>>()) {
        signers.push_back(notary::schema::make_hash32(value));
      }
    }
    return notary::schema::create_document_t{
        .document_hash = vm["document-hash"].as<std::string>(),
        .required_signers = signers};
  }
  if (payload == "sign_document") {
    return notary::schema::sign_document_t{
        .document_id = vm["document-id"].as<uint64_t>()};
  }
  if (payload == "revoke_document") {
    return notary::schema::revoke_document_t{
        .document_id = vm["document-id"].as<uint64_t>()};
  }
  if (payload == "set_storage_fee") {
    return notary::schema::set_storage_fee_t{.fee = get_amount(vm, "fee")};
  }
  if (payload == "withdraw_fees") {
    return notary::schema::withdraw_fees_t{};
  }
  notary::common::critical("unsupported payload type");
}

notary::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/engine/keyspaces" ||
      path == "/access/owner" || path == "/treasury/state") {
    return {};
  }
  if (path == "/access/has_role") {
    return encoder.encode(std::tuple{get_hash32(vm, "account"), get_role(vm)});
  }
  if (path == "/registry/item") {
    return encoder.encode(vm["item-id"].as<uint64_t>());
  }
  if (path == "/registry/items_of" || path == "/attestation/user_documents" ||
      path == "/attestation/signer_documents") {
    return encoder.encode(get_hash32(vm, "account"));
  }
  if (path == "/attestation/document") {
    return encoder.encode(vm["document-id"].as<uint64_t>());
  }
  if (path == "/attestation/has_signed" ||
      path == "/attestation/is_required_signer") {
    return encoder.encode(
        std::tuple{vm["document-id"].as<uint64_t>(), get_hash32(vm, "account")});
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  if (path == "/events/range") {
    return encoder.encode(std::tuple{vm["from-id"].as<uint64_t>(),
                                     vm["to-id"].as<uint64_t>()});
  }
  notary::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction [options]\n"
            << "  transaction_builder query-key [options]\n"
            << "  transaction_builder chain-id\n"
            << "  transaction_builder account --name <name>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|chain-id|account")(
      "payload", po::value<std::string>(), "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "nonce", po::value<uint64_t>()->default_value(0), "transaction nonce")(
      "signer", po::value<std::string>(), "caller account hex")(
      "value", po::value<std::string>()->default_value("0"),
      "attached native value (decimal)")(
      "account", po::value<std::string>(), "target account hex")(
      "role", po::value<std::string>()->default_value("curator"),
      "admin|curator")("uri", po::value<std::string>()->default_value(""),
                       "item uri")(
      "category", po::value<std::string>()->default_value(""),
      "item category")("item-id", po::value<uint64_t>()->default_value(0),
                       "item id")(
      "verified", po::value<bool>()->default_value(false), "verified flag")(
      "active", po::value<bool>()->default_value(true), "active flag")(
      "document-hash", po::value<std::string>()->default_value(""),
      "document content hash")(
      "required-signer", po::value<std::vector<std::string>>()->multitoken(),
      "required signer account hex values")(
      "document-id", po::value<uint64_t>()->default_value(1), "document id")(
      "fee", po::value<std::string>()->default_value("0"),
      "storage fee (decimal)")("name", po::value<std::string>(),
                               "account name to derive an id from")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "history range from")(
      "to-height", po::value<uint64_t>()->default_value(1), "history range to")(
      "from-id", po::value<uint64_t>()->default_value(1), "event range from")(
      "to-id", po::value<uint64_t>()->default_value(1), "event range to");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      notary::common::critical("transaction mode requires --payload");
    }
    auto transaction = notary::schema::transaction_t{
        .version = 1,
        .chain_id = get_hash32(vm, "chain-id"),
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = get_hash32(vm, "signer"),
        .value = get_amount(vm, "value"),
        .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << notary::schema::to_hex(
                     notary::schema::bytes_view_t{encoded.data(),
                                                  encoded.size()})
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      notary::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << notary::schema::to_hex(
                     notary::schema::bytes_view_t{key.data(), key.size()})
              << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << notary::schema::to_hex(
                     notary::blake3::hash(std::string_view{"notary-ledger"}))
              << '\n';
    return 0;
  }

  if (command == "account") {
    if (!vm.contains("name")) {
      notary::common::critical("account mode requires --name");
    }
    std::cout << notary::schema::to_hex(
                     notary::blake3::hash(
                     std::string_view{vm["name"].as<std::string>()}))
              << '\n';
    return 0;
  }

  notary::common::critical("command must be transaction|query-key|chain-id|account");
}
