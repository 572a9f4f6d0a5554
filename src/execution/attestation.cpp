#include <spdlog/spdlog.h>
#include <algorithm>
#include <notary/execution/account_index.hpp>
#include <notary/execution/attestation.hpp>
#include <notary/execution/reentrancy_guard.hpp>
#include <notary/execution/result.hpp>
#include <notary/execution/sequence.hpp>
#include <notary/execution/treasury.hpp>
#include <notary/schema/key/engine_keys.hpp>

using namespace notary::schema;

namespace notary::execution::attestation {

namespace {

constexpr auto kDocumentIds = sequence{key::kDocumentSequence, 1};

bool contains(const std::vector<account_id_t>& accounts,
              const account_id_t& account) {
  return std::find(std::begin(accounts), std::end(accounts), account) !=
         std::end(accounts);
}

std::vector<account_id_t> unique_signers(
    const std::vector<account_id_t>& signers) {
  auto unique = std::vector<account_id_t>{};
  unique.reserve(signers.size());
  for (const auto& signer : signers) {
    if (!contains(unique, signer)) {
      unique.push_back(signer);
    }
  }
  return unique;
}

void put_document(execution_context& ctx, const document_state_t& document) {
  ctx.state.put(ctx.encoder,
                key::make_document_key(ctx.encoder, document.document_id),
                document);
}

}  // namespace

transaction_result_t create_document(execution_context& ctx,
                                     const create_document_t& payload) {
  if (ctx.entered) {
    return make_error(transaction_error_code::reentrant,
                      "re-entrant call rejected");
  }
  auto fee = treasury::storage_fee(ctx.state, ctx.encoder);
  if (ctx.value < fee) {
    return make_error(transaction_error_code::insufficient_fee,
                      "attached value is below the storage fee");
  }
  if (payload.document_hash.empty()) {
    return make_error(transaction_error_code::invalid_input,
                      "document hash must not be empty");
  }
  if (payload.required_signers.empty()) {
    return make_error(transaction_error_code::invalid_input,
                      "required signer list must not be empty");
  }
  if (std::any_of(std::begin(payload.required_signers),
                  std::end(payload.required_signers), is_null_account)) {
    return make_error(transaction_error_code::invalid_account,
                      "required signer is the null account");
  }

  auto guard = reentrancy_guard{ctx.entered};

  auto document = document_state_t{};
  document.document_id = kDocumentIds.next(ctx.state, ctx.encoder);
  document.document_hash = payload.document_hash;
  document.creator = ctx.caller;
  document.created_at = ctx.block_time;
  document.required_signers = unique_signers(payload.required_signers);

  if (ctx.value > 0) {
    auto treasury_account = treasury::treasury_account(ctx.state, ctx.encoder);
    if (!ctx.rail.transfer ||
        !ctx.rail.transfer(ctx.caller, treasury_account, ctx.value)) {
      return make_error(transaction_error_code::transfer_rejected,
                        "storage fee transfer to treasury was rejected");
    }
  }

  put_document(ctx, document);
  account_index::append(ctx.state, ctx.encoder, key::kCreatorIndexPrefix,
                        document.creator, document.document_id);
  for (const auto& signer : document.required_signers) {
    account_index::append(ctx.state, ctx.encoder, key::kSignerIndexPrefix,
                          signer, document.document_id);
  }
  emit(ctx, ledger_event_type_t::document_created,
       {make_id_attribute("document_id", document.document_id),
        make_account_attribute("creator", document.creator),
        make_attribute("document_hash", document.document_hash)});
  spdlog::debug("Created document {} with {} required signer(s)",
                document.document_id, document.required_signers.size());
  return make_success_with(ctx.encoder, document.document_id,
                           "document created");
}

transaction_result_t sign_document(execution_context& ctx,
                                   const sign_document_t& payload) {
  auto document = get_document(ctx.state, ctx.encoder, payload.document_id);
  if (!document) {
    return make_error(transaction_error_code::not_found,
                      "document not found");
  }
  if (!document->is_active) {
    return make_error(transaction_error_code::document_inactive,
                      "document is not active");
  }
  if (document->is_completed) {
    return make_error(transaction_error_code::already_completed,
                      "document is already completed");
  }
  if (contains(document->signatures, ctx.caller)) {
    return make_error(transaction_error_code::already_signed,
                      "caller has already signed");
  }
  if (!contains(document->required_signers, ctx.caller)) {
    return make_error(transaction_error_code::not_required_signer,
                      "caller is not a required signer");
  }

  document->signatures.push_back(ctx.caller);
  document->signature_count =
      static_cast<uint32_t>(document->signatures.size());
  emit(ctx, ledger_event_type_t::document_signed,
       {make_id_attribute("document_id", document->document_id),
        make_account_attribute("signer", ctx.caller)});
  if (document->signature_count == document->required_signers.size()) {
    document->is_completed = true;
    emit(ctx, ledger_event_type_t::document_completed,
         {make_id_attribute("document_id", document->document_id)});
    spdlog::info("Document {} completed", document->document_id);
  }
  put_document(ctx, *document);
  return make_success("document signed");
}

transaction_result_t revoke_document(execution_context& ctx,
                                     const revoke_document_t& payload) {
  auto document = get_document(ctx.state, ctx.encoder, payload.document_id);
  if (!document) {
    return make_error(transaction_error_code::not_found,
                      "document not found");
  }
  if (document->creator != ctx.caller) {
    return make_error(transaction_error_code::unauthorized,
                      "caller is not the document creator");
  }
  if (!document->is_active) {
    return make_error(transaction_error_code::already_inactive,
                      "document is already inactive");
  }
  if (document->is_completed) {
    return make_error(transaction_error_code::already_completed,
                      "completed documents cannot be revoked");
  }

  document->is_active = false;
  put_document(ctx, *document);
  emit(ctx, ledger_event_type_t::document_revoked,
       {make_id_attribute("document_id", document->document_id)});
  return make_success("document revoked");
}

std::optional<document_state_t> get_document(const state_overlay& state,
                                             encoder_t& encoder,
                                             const document_id_t document_id) {
  return state.get<document_state_t>(
      encoder, key::make_document_key(encoder, document_id));
}

bool has_user_signed(const state_overlay& state,
                     encoder_t& encoder,
                     const document_id_t document_id,
                     const account_id_t& account) {
  auto document = get_document(state, encoder, document_id);
  return document.has_value() && contains(document->signatures, account);
}

bool is_required_signer(const state_overlay& state,
                        encoder_t& encoder,
                        const document_id_t document_id,
                        const account_id_t& account) {
  auto document = get_document(state, encoder, document_id);
  return document.has_value() &&
         contains(document->required_signers, account);
}

std::vector<document_id_t> user_documents(const state_overlay& state,
                                          encoder_t& encoder,
                                          const account_id_t& account) {
  return account_index::read(state, encoder, key::kCreatorIndexPrefix,
                             account);
}

std::vector<document_id_t> signer_documents(const state_overlay& state,
                                            encoder_t& encoder,
                                            const account_id_t& account) {
  return account_index::read(state, encoder, key::kSignerIndexPrefix, account);
}

}  // namespace notary::execution::attestation
