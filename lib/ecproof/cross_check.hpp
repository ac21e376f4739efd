// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "constrained.hpp"
#include "recovery.hpp"
#include <string>

namespace ecproof
{
/// The results of evaluating the same input in the native and the constrained context.
struct CrossCheckReport
{
    VerificationOutcome native;
    VerificationOutcome constrained;
    Intermediates native_intermediates;
    Intermediates constrained_intermediates;
    constrained::Shape shape;

    /// Both contexts agree on the outcome and on every intermediate value both computed.
    [[nodiscard]] bool consistent() const noexcept;

    /// Names the first value the contexts disagree on, empty if consistent.
    [[nodiscard]] std::string divergence() const;
};

/// Evaluates the input in both contexts.
///
/// The contexts are two realizations of the same predicate, so any disagreement
/// is a defect in one of them.
CrossCheckReport cross_check(const VerificationInput& input) noexcept;
}  // namespace ecproof
