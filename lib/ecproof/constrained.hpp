// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "recovery.hpp"
#include <ecproof_crypto/secp256k1.hpp>
#include <array>
#include <utility>

/// The constrained-arithmetic evaluation context.
///
/// Every operation of an evaluation maps to a constraint of an arithmetic circuit and
/// is recorded in the Trace. No control flow depends on the input values: conditionals
/// are arithmetic selections by a boolean value, the inversion is the exponentiation by
/// the public exponent ORDER-2, and the scalar multiplication is a double-and-add-always
/// ladder over complete addition formulas. The evaluation shape is therefore the same
/// for all inputs.
namespace ecproof::constrained
{
using secp256k1::Curve;
using Fp = Curve::Fp;
using Fr = Curve::Fr;
using intx::uint256;

/// The number of constraints of each kind emitted by an evaluation.
struct Shape
{
    uint64_t multiplications = 0;
    uint64_t additions = 0;
    uint64_t selections = 0;
    uint64_t range_checks = 0;
    uint64_t hashes = 0;

    friend bool operator==(const Shape&, const Shape&) = default;
};

/// Records the shape of a single evaluation.
class Trace
{
    Shape shape_;

public:
    void multiplication() noexcept { ++shape_.multiplications; }
    void addition() noexcept { ++shape_.additions; }
    void selection() noexcept { ++shape_.selections; }
    void range_check() noexcept { ++shape_.range_checks; }
    void hash() noexcept { ++shape_.hashes; }

    const Shape& shape() const noexcept { return shape_; }
};

/// A value constrained to {0, 1}.
class Bit
{
    uint64_t value_ = 0;

public:
    Bit() = default;
    constexpr explicit Bit(bool b) noexcept : value_{b} {}

    constexpr uint64_t value() const noexcept { return value_; }
    constexpr explicit operator bool() const noexcept { return value_ != 0; }

    friend constexpr bool operator==(Bit, Bit) = default;
};

/// A field value flowing through the evaluation.
template <typename FE>
class Var
{
    Trace* trace_;
    FE value_;

public:
    Var(Trace& trace, const FE& value) noexcept : trace_{&trace}, value_{value} {}

    static Var constant(Trace& trace, const typename FE::uint_type& v) noexcept
    {
        return {trace, FE{v}};
    }

    /// The 0/1 field value of the bit.
    static Var from_bit(Trace& trace, Bit b) noexcept
    {
        return {trace, FE{typename FE::uint_type{b.value()}}};
    }

    Trace& trace() const noexcept { return *trace_; }

    const FE& value() const noexcept { return value_; }

    friend Var operator*(const Var& a, const Var& b) noexcept
    {
        a.trace_->multiplication();
        return {*a.trace_, a.value_ * b.value_};
    }

    friend Var operator+(const Var& a, const Var& b) noexcept
    {
        a.trace_->addition();
        return {*a.trace_, a.value_ + b.value_};
    }

    friend Var operator-(const Var& a, const Var& b) noexcept
    {
        a.trace_->addition();
        return {*a.trace_, a.value_ - b.value_};
    }
};

inline Bit bit_and(Trace& trace, Bit a, Bit b) noexcept
{
    trace.multiplication();
    return Bit{(a.value() & b.value()) != 0};
}

inline Bit bit_not(Trace& trace, Bit a) noexcept
{
    trace.addition();
    return Bit{(1 - a.value()) != 0};
}

/// Arithmetic multiplexer: x if b else y, computed as y + b⋅(x - y).
template <typename FE>
Var<FE> select(Bit b, const Var<FE>& x, const Var<FE>& y) noexcept
{
    auto& trace = x.trace();
    trace.selection();
    return y + Var<FE>::from_bit(trace, b) * (x - y);
}

/// Computes x^e for the public exponent e.
template <typename FE>
Var<FE> pow(const Var<FE>& x, const typename FE::uint_type& e) noexcept
{
    auto r = Var<FE>::constant(x.trace(), 1);
    for (auto i = sizeof(e) * 8; i != 0; --i)
    {
        r = r * r;
        if (ecc::bit_test(e, i - 1))
            r = r * x;
    }
    return r;
}

/// The inversion by Fermat's little theorem: x^(ORDER-2). The inversion of 0 is 0.
template <typename FE>
Var<FE> inverse(const Var<FE>& x) noexcept
{
    return pow(x, FE::ORDER - 2);
}

/// The zero test using the inversion hint: x⋅x⁻¹ is 1 for x ≠ 0 and 0 for x = 0.
template <typename FE>
Bit is_zero(const Var<FE>& x) noexcept
{
    const auto t = x * inverse(x);
    x.trace().range_check();
    return Bit{t.value().value()[0] == 0};
}

/// Decomposes the value into 256 bits, the least significant first.
template <typename FE>
std::array<Bit, 256> to_bits(const Var<FE>& x) noexcept
{
    const auto v = x.value().value();
    std::array<Bit, 256> bits;
    for (size_t i = 0; i < bits.size(); ++i)
    {
        x.trace().range_check();
        x.trace().addition();  // The recomposition term.
        bits[i] = Bit{ecc::bit_test(v, i)};
    }
    return bits;
}

/// Checks v < bound and reduces v by the bound once, without branching.
///
/// Requires v < 2⋅bound so that the single subtraction gives the residue.
std::pair<Bit, uint256> reduce(Trace& trace, const uint256& v, const uint256& bound) noexcept;

/// The secp256k1 point in homogeneous projective coordinates (X : Y : Z)
/// representing (X/Z, Y/Z). The point at infinity is (0 : 1 : 0).
struct Point
{
    Var<Fp> x;
    Var<Fp> y;
    Var<Fp> z;
};

/// The point at infinity.
Point infinity(Trace& trace) noexcept;

/// The affine point lifted to projective coordinates.
Point from_affine(const Var<Fp>& x, const Var<Fp>& y) noexcept;

/// Complete point addition for y² = x³ + b, handling doubling and the point at infinity
/// without exceptional cases. Algorithm 7 of https://eprint.iacr.org/2015/1060.pdf.
Point add(const Point& p, const Point& q) noexcept;

/// p if b else q.
Point select(Bit b, const Point& p, const Point& q) noexcept;

/// Computes u₁×G ⊕ u₂×Q with the double-and-add-always ladder.
Point mul_add(const std::array<Bit, 256>& u1, const std::array<Bit, 256>& u2, const Point& q) noexcept;

/// The result of a constrained evaluation.
struct Evaluation
{
    VerificationOutcome outcome;
    Intermediates intermediates;
    Shape shape;
};

/// Evaluates the whole verification in the constrained context.
///
/// All the checks are computed regardless of the earlier ones. The outcome reports
/// the first violated check in the order of the native evaluation.
Evaluation evaluate(const VerificationInput& input) noexcept;

/// The constrained evaluation of the whole verification.
VerificationOutcome verify_constrained(const VerificationInput& input) noexcept;
}  // namespace ecproof::constrained
