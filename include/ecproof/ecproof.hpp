// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace ecproof
{
/// The ECDSA signature (r, s) in the big-endian byte form, without the recovery byte.
struct Signature
{
    evmc::bytes32 r;
    evmc::bytes32 s;

    friend bool operator==(const Signature&, const Signature&) = default;
};

/// The fixed-width inputs of a single verification.
struct VerificationInput
{
    evmc::bytes32 pub_key_x;
    evmc::bytes32 pub_key_y;
    Signature signature;
    evmc::bytes32 hashed_message;

    /// The public input: the address the prover claims to control.
    evmc::address expected_address;

    friend bool operator==(const VerificationInput&, const VerificationInput&) = default;
};

/// The verification inputs as hex strings supplied by external tooling.
struct HexInput
{
    std::string pub_key_x;
    std::string pub_key_y;
    std::string signature;  ///< 64 bytes, or 65 bytes with the trailing recovery byte.
    std::string hashed_message;
    std::string expected_address;
};

/// The reason of a failed verification.
enum class Reason : uint8_t
{
    malformed_input,     ///< Wrong length, non-hex character or value out of range.
    point_not_on_curve,  ///< The public key does not satisfy the curve equation.
    recovery_failed,     ///< The signature does not verify under the public key.
    address_mismatch,    ///< The derived address differs from the expected one.
};

/// The verification outcome: the derived address when valid, the failure reason otherwise.
///
/// Every reason means "not proven". The reason is meant for diagnostics only.
using VerificationOutcome = std::variant<evmc::address, Reason>;

/// The evaluation context of the verification.
enum class Mode : uint8_t
{
    native,       ///< Direct evaluation, returns at the first failed check.
    constrained,  ///< Fixed-shape evaluation suitable for a constraint system.
};

/// Returns the name of the reason, e.g. "address_mismatch".
std::string_view to_string(Reason reason) noexcept;

/// Returns the name of the mode, e.g. "native".
std::string_view to_string(Mode mode) noexcept;

inline bool is_valid(const VerificationOutcome& outcome) noexcept
{
    return std::holds_alternative<evmc::address>(outcome);
}

/// Verifies that the signature over the hashed message is valid under the public key
/// and that the public key corresponds to the expected address.
VerificationOutcome verify(const VerificationInput& input, Mode mode = Mode::native) noexcept;

/// Decodes the hex inputs and verifies them. Decoding failures give Reason::malformed_input.
VerificationOutcome verify(const HexInput& input, Mode mode = Mode::native) noexcept;
}  // namespace ecproof
