#pragma once

#include <notary/execution/context.hpp>
#include <notary/schema/create_document.hpp>
#include <notary/schema/document_state.hpp>
#include <notary/schema/revoke_document.hpp>
#include <notary/schema/sign_document.hpp>
#include <notary/schema/transaction_result.hpp>
#include <optional>
#include <vector>

// Multi-party document attestation.
//
// Created(active) -> [Signed]* -> Completed(active), with Active -> Revoked
// open to the creator only before completion.
namespace notary::execution::attestation {

/// Charges the attached value against the storage fee and moves it to the
/// treasury account through the value rail. Ids start at 1 and are returned
/// SCALE-encoded in the result data. Duplicate required signers are dropped,
/// keeping first-occurrence order.
notary::schema::transaction_result_t create_document(
    execution_context& ctx,
    const notary::schema::create_document_t& payload);

/// Records the caller's attestation. The signature that fills the required
/// set also completes the document.
notary::schema::transaction_result_t sign_document(
    execution_context& ctx,
    const notary::schema::sign_document_t& payload);

/// Creator-only, before completion. The storage fee is not refunded.
notary::schema::transaction_result_t revoke_document(
    execution_context& ctx,
    const notary::schema::revoke_document_t& payload);

std::optional<notary::schema::document_state_t> get_document(
    const state_overlay& state,
    encoder_t& encoder,
    notary::schema::document_id_t document_id);

bool has_user_signed(const state_overlay& state,
                     encoder_t& encoder,
                     notary::schema::document_id_t document_id,
                     const notary::schema::account_id_t& account);

bool is_required_signer(const state_overlay& state,
                        encoder_t& encoder,
                        notary::schema::document_id_t document_id,
                        const notary::schema::account_id_t& account);

std::vector<notary::schema::document_id_t> user_documents(
    const state_overlay& state,
    encoder_t& encoder,
    const notary::schema::account_id_t& account);

std::vector<notary::schema::document_id_t> signer_documents(
    const state_overlay& state,
    encoder_t& encoder,
    const notary::schema::account_id_t& account);

}  // namespace notary::execution::attestation
