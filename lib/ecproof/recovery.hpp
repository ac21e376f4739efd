// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ecproof/ecproof.hpp>
#include <intx/intx.hpp>
#include <optional>

namespace ecproof
{
/// The values computed on the way to the outcome, exposed for cross-checking evaluations.
///
/// The native evaluation stops at the first failed check so the values of the later steps
/// stay unset.
struct Intermediates
{
    /// 0 < r < N and 0 < s < N.
    std::optional<bool> signature_in_range;

    /// Both public key coordinates are < P.
    std::optional<bool> public_key_in_range;

    /// The public key satisfies the curve equation.
    std::optional<bool> public_key_on_curve;

    /// The x coordinate of u₁×G ⊕ u₂×Q reduced modulo N.
    std::optional<intx::uint256> verification_x;

    /// The signature verifies under the public key.
    std::optional<bool> signature_valid;

    /// The address derived from the public key.
    std::optional<evmc::address> derived_address;

    friend bool operator==(const Intermediates&, const Intermediates&) = default;
};

/// Recovers the signer address in the verify-then-derive way: checks the signature
/// against the given public key and derives the address from that key.
///
/// Returns the first violated precondition:
/// Reason::malformed_input for r, s not in [1, N-1] or coordinates not below P,
/// Reason::point_not_on_curve, Reason::recovery_failed.
VerificationOutcome recover_address(const evmc::bytes32& pub_key_x,
    const evmc::bytes32& pub_key_y, const Signature& signature, const evmc::bytes32& digest,
    Intermediates* intermediates = nullptr) noexcept;

/// The verification predicate: compares the recovered address with the expected one.
///
/// Failures of the recovery pass through unchanged.
VerificationOutcome check_address(
    const VerificationOutcome& recovered, const evmc::address& expected_address) noexcept;

/// The native evaluation of the whole verification.
VerificationOutcome verify_native(
    const VerificationInput& input, Intermediates* intermediates = nullptr) noexcept;
}  // namespace ecproof
