#include <gtest/gtest.h>
#include <notary/blake3/hash.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/role_id.hpp>
#include <notary/schema/transaction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef NOTARY_TRANSACTION_BUILDER_PATH
#define NOTARY_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

constexpr auto kAccountA =
    "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
constexpr auto kAccountB =
    "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";
constexpr auto kChainId =
    "cccccccccccccccccccccccccccccccccccccccccccccccccccccccccccccccc";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen((command + " 2>/dev/null").c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder,
                        const std::string_view args) {
  auto command = shell_quote(builder) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim(output);
}

std::string builder_path() {
  return std::string{NOTARY_TRANSACTION_BUILDER_PATH};
}

notary::schema::transaction_t decode_transaction(const std::string& hex) {
  auto bytes = notary::schema::from_hex(hex);
  auto encoder = encoder_t{};
  return encoder.decode<notary::schema::transaction_t>(
      notary::schema::bytes_view_t{bytes.data(), bytes.size()});
}

}  // namespace

TEST(transaction_builder, query_keys_match_route_contract) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto encoder = encoder_t{};
  auto account = notary::schema::make_hash32(std::string_view{kAccountA});

  auto to_hex = [](const notary::schema::bytes_t& bytes) {
    return notary::schema::to_hex(
        notary::schema::bytes_view_t{bytes.data(), bytes.size()});
  };

  EXPECT_EQ(run_builder(builder, "query-key --path /engine/info"), "");
  EXPECT_EQ(
      run_builder(builder, std::string{"query-key --path /access/has_role "
                                       "--role admin --account "} +
                               kAccountA),
      to_hex(encoder.encode(
          std::tuple{account, notary::schema::role_id_t::admin})));
  EXPECT_EQ(run_builder(builder, "query-key --path /registry/item --item-id 7"),
            to_hex(encoder.encode(uint64_t{7})));
  EXPECT_EQ(run_builder(builder,
                        std::string{"query-key --path /attestation/has_signed "
                                    "--document-id 3 --account "} +
                            kAccountA),
            to_hex(encoder.encode(std::tuple{uint64_t{3}, account})));
  EXPECT_EQ(run_builder(builder, "query-key --path /events/range --from-id 2 "
                                 "--to-id 9"),
            to_hex(encoder.encode(std::tuple{uint64_t{2}, uint64_t{9}})));
}

TEST(transaction_builder, create_document_transaction_decodes) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto hex = run_builder(
      builder, std::string{"transaction --payload create_document --chain-id "} +
                   kChainId + " --signer " + kAccountA +
                   " --nonce 4 --value 250 --document-hash sha256:ff"
                   " --required-signer " +
                   kAccountA + " " + kAccountB);
  auto tx = decode_transaction(hex);
  EXPECT_EQ(tx.nonce, 4u);
  EXPECT_EQ(tx.value, 250);
  EXPECT_EQ(tx.chain_id, notary::schema::make_hash32(std::string_view{kChainId}));
  const auto& payload = std::get<notary::schema::create_document_t>(tx.payload);
  EXPECT_EQ(payload.document_hash, "sha256:ff");
  ASSERT_EQ(payload.required_signers.size(), 2u);
  EXPECT_EQ(payload.required_signers[1],
            notary::schema::make_hash32(std::string_view{kAccountB}));
}

TEST(transaction_builder, role_and_item_payloads_decode) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto grant = decode_transaction(run_builder(
      builder, std::string{"tx --payload grant_role --role curator --chain-id "} +
                   kChainId + " --signer " + kAccountA + " --account " +
                   kAccountB));
  const auto& grant_payload =
      std::get<notary::schema::grant_role_t>(grant.payload);
  EXPECT_EQ(grant_payload.role, notary::schema::role_id_t::curator);
  EXPECT_EQ(grant_payload.account,
            notary::schema::make_hash32(std::string_view{kAccountB}));

  auto moderate = decode_transaction(run_builder(
      builder, std::string{"tx --payload moderate_item --item-id 5 "
                           "--verified true --active false --chain-id "} +
                   kChainId + " --signer " + kAccountA));
  const auto& moderate_payload =
      std::get<notary::schema::moderate_item_t>(moderate.payload);
  EXPECT_EQ(moderate_payload.item_id, 5u);
  EXPECT_TRUE(moderate_payload.verified);
  EXPECT_FALSE(moderate_payload.active);
}

TEST(transaction_builder, derived_identities_use_blake3) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  EXPECT_EQ(run_builder(builder, "chain-id"),
            notary::schema::to_hex(
                notary::blake3::hash(std::string_view{"notary-ledger"})));
  EXPECT_EQ(run_builder(builder, "account --name alice"),
            notary::schema::to_hex(
                notary::blake3::hash(std::string_view{"alice"})));
}

TEST(transaction_builder, unknown_payload_fails) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto command = shell_quote(builder) +
                 " transaction --payload create_vault --chain-id " + kChainId +
                 " --signer " + kAccountA;
  auto [exit_code, output] = run_capture(command);
  EXPECT_NE(exit_code, 0) << output;
}
