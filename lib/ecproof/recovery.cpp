// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0

#include "recovery.hpp"
#include <ecproof_crypto/secp256k1.hpp>

namespace ecproof
{
using namespace secp256k1;

VerificationOutcome recover_address(const evmc::bytes32& pub_key_x,
    const evmc::bytes32& pub_key_y, const Signature& signature, const evmc::bytes32& digest,
    Intermediates* intermediates) noexcept
{
    Intermediates unused;
    auto& im = intermediates != nullptr ? *intermediates : unused;

    const auto r = be::load<uint256>(signature.r);
    const auto s = be::load<uint256>(signature.s);
    im.signature_in_range = r != 0 && r < Curve::ORDER && s != 0 && s < Curve::ORDER;

    const auto x = be::load<uint256>(pub_key_x);
    const auto y = be::load<uint256>(pub_key_y);
    im.public_key_in_range = x < Curve::FIELD_PRIME && y < Curve::FIELD_PRIME;

    if (!*im.signature_in_range || !*im.public_key_in_range)
        return Reason::malformed_input;

    const AffinePoint q{Curve::Fp{x}, Curve::Fp{y}};
    im.public_key_on_curve = is_on_curve(q);
    if (!*im.public_key_on_curve)
        return Reason::point_not_on_curve;

    im.verification_x = verification_point_x(digest, r, s, q);
    im.signature_valid = *im.verification_x == r;
    if (!*im.signature_valid)
        return Reason::recovery_failed;

    im.derived_address = to_address(q);
    return *im.derived_address;
}

VerificationOutcome check_address(
    const VerificationOutcome& recovered, const evmc::address& expected_address) noexcept
{
    const auto* derived = std::get_if<evmc::address>(&recovered);
    if (derived == nullptr)
        return recovered;

    if (*derived != expected_address)
        return Reason::address_mismatch;
    return *derived;
}

VerificationOutcome verify_native(
    const VerificationInput& input, Intermediates* intermediates) noexcept
{
    const auto recovered = recover_address(
        input.pub_key_x, input.pub_key_y, input.signature, input.hashed_message, intermediates);
    return check_address(recovered, input.expected_address);
}
}  // namespace ecproof
