// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0

#include "cross_check.hpp"

namespace ecproof
{
namespace
{
/// Values computed by only one of the contexts do not count as a disagreement.
template <typename T>
bool agree(const std::optional<T>& a, const std::optional<T>& b) noexcept
{
    return !a.has_value() || !b.has_value() || *a == *b;
}
}  // namespace

bool CrossCheckReport::consistent() const noexcept
{
    const auto& a = native_intermediates;
    const auto& b = constrained_intermediates;
    return native == constrained && agree(a.signature_in_range, b.signature_in_range) &&
           agree(a.public_key_in_range, b.public_key_in_range) &&
           agree(a.public_key_on_curve, b.public_key_on_curve) &&
           agree(a.verification_x, b.verification_x) &&
           agree(a.signature_valid, b.signature_valid) &&
           agree(a.derived_address, b.derived_address);
}

std::string CrossCheckReport::divergence() const
{
    const auto& a = native_intermediates;
    const auto& b = constrained_intermediates;
    if (!agree(a.signature_in_range, b.signature_in_range))
        return "signature_in_range";
    if (!agree(a.public_key_in_range, b.public_key_in_range))
        return "public_key_in_range";
    if (!agree(a.public_key_on_curve, b.public_key_on_curve))
        return "public_key_on_curve";
    if (!agree(a.verification_x, b.verification_x))
        return "verification_x";
    if (!agree(a.signature_valid, b.signature_valid))
        return "signature_valid";
    if (!agree(a.derived_address, b.derived_address))
        return "derived_address";
    if (native != constrained)
        return "outcome";
    return {};
}

CrossCheckReport cross_check(const VerificationInput& input) noexcept
{
    CrossCheckReport report;
    report.native = verify_native(input, &report.native_intermediates);

    auto evaluation = constrained::evaluate(input);
    report.constrained = evaluation.outcome;
    report.constrained_intermediates = evaluation.intermediates;
    report.shape = evaluation.shape;
    return report;
}
}  // namespace ecproof
