// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0

#include "constrained.hpp"
#include "encoding.hpp"
#include "recovery.hpp"
#include <ecproof/ecproof.hpp>

namespace ecproof
{
std::string_view to_string(Reason reason) noexcept
{
    switch (reason)
    {
    case Reason::malformed_input:
        return "malformed_input";
    case Reason::point_not_on_curve:
        return "point_not_on_curve";
    case Reason::recovery_failed:
        return "recovery_failed";
    case Reason::address_mismatch:
        return "address_mismatch";
    }
    return "<unknown>";
}

std::string_view to_string(Mode mode) noexcept
{
    switch (mode)
    {
    case Mode::native:
        return "native";
    case Mode::constrained:
        return "constrained";
    }
    return "<unknown>";
}

VerificationOutcome verify(const VerificationInput& input, Mode mode) noexcept
{
    if (mode == Mode::constrained)
        return constrained::verify_constrained(input);
    return verify_native(input);
}

VerificationOutcome verify(const HexInput& input, Mode mode) noexcept
{
    const auto decoded = encoding::decode_input(input);
    if (!decoded.has_value())
        return Reason::malformed_input;
    return verify(*decoded, mode);
}
}  // namespace ecproof
