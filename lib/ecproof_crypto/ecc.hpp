// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ecproof/modarith.hpp>
#include <algorithm>
#include <span>
#include <type_traits>

namespace ecproof::ecc
{
template <int N>
struct Constant : std::integral_constant<int, N>
{
    consteval explicit(false) Constant(int v) noexcept
    {
        if (N != v)
            intx::unreachable();
    }
};
using zero_t = Constant<0>;
using one_t = Constant<1>;

/// Tests the i-th bit of the unsigned integer x.
template <typename UintT>
constexpr bool bit_test(const UintT& x, size_t i) noexcept
{
    return ((x[i / 64] >> (i % 64)) & 1) != 0;
}

/// Computes x^e with left-to-right square-and-multiply.
///
/// The sequence of operations depends only on the exponent.
template <typename FE>
constexpr FE pow(const FE& x, const typename FE::uint_type& e) noexcept
{
    auto r = FE::one();
    for (auto i = sizeof(e) * 8; i != 0; --i)
    {
        r = r * r;
        if (bit_test(e, i - 1))
            r = r * x;
    }
    return r;
}

/// An element of the prime field defined by Spec::ORDER, kept in Montgomery form.
template <typename Spec>
struct FieldElement
{
    using uint_type = std::remove_cvref_t<decltype(Spec::ORDER)>;

    /// The field modulus.
    static constexpr auto& ORDER = Spec::ORDER;

    static constexpr ModArith<uint_type> arith{Spec::ORDER};

    uint_type value_{};

    FieldElement() = default;

    /// Creates the element from the value v < ORDER.
    constexpr explicit FieldElement(uint_type v) : value_{arith.to_mont(v)} {}

    constexpr uint_type value() const noexcept { return arith.from_mont(value_); }

    static constexpr FieldElement one() noexcept { return FieldElement{1}; }

    static constexpr FieldElement from_bytes(std::span<const uint8_t, sizeof(uint_type)> b) noexcept
    {
        return FieldElement{intx::be::unsafe::load<uint_type>(b.data())};
    }

    constexpr void to_bytes(std::span<uint8_t, sizeof(uint_type)> b) const noexcept
    {
        intx::be::unsafe::store(b.data(), value());
    }

    /// The inverse by Fermat's little theorem, x^(ORDER-2). The inverse of 0 is 0.
    constexpr FieldElement inv() const noexcept { return pow(*this, ORDER - 2); }

    friend constexpr bool operator==(const FieldElement&, const FieldElement&) = default;

    friend constexpr bool operator==(const FieldElement& a, zero_t) noexcept { return !a.value_; }

    friend constexpr auto operator*(const FieldElement& a, const FieldElement& b) noexcept
    {
        return wrap(arith.mul(a.value_, b.value_));
    }

    friend constexpr auto operator+(const FieldElement& a, const FieldElement& b) noexcept
    {
        return wrap(arith.add(a.value_, b.value_));
    }

    friend constexpr auto operator-(const FieldElement& a, const FieldElement& b) noexcept
    {
        return wrap(arith.sub(a.value_, b.value_));
    }

    friend constexpr auto operator-(const FieldElement& a) noexcept
    {
        return wrap(arith.sub(0, a.value_));
    }

    friend constexpr auto operator/(one_t, const FieldElement& a) noexcept { return a.inv(); }

    friend constexpr auto operator/(const FieldElement& a, const FieldElement& b) noexcept
    {
        return a * b.inv();
    }

    /// Wraps a raw value into the element assuming it is already in Montgomery form.
    [[gnu::always_inline]] static constexpr FieldElement wrap(const uint_type& v) noexcept
    {
        FieldElement element;
        element.value_ = v;
        return element;
    }
};

/// The affine (two coordinates) point on an Elliptic Curve over a prime field.
/// The default constructed point (0, 0) represents the point at infinity.
template <typename Curve>
struct AffinePoint
{
    using FE = typename Curve::Fp;

    FE x;
    FE y;

    AffinePoint() = default;
    constexpr AffinePoint(const FE& x_, const FE& y_) noexcept : x{x_}, y{y_} {}

    /// Create the point from literal values.
    consteval AffinePoint(
        const typename Curve::uint_type& x_value, const typename Curve::uint_type& y_value) noexcept
      : x{x_value}, y{y_value}
    {}

    friend constexpr bool operator==(const AffinePoint&, const AffinePoint&) = default;

    friend constexpr bool operator==(const AffinePoint& p, zero_t) noexcept
    {
        return p == AffinePoint{};
    }

    constexpr void to_bytes(std::span<uint8_t, sizeof(FE) * 2> b) const noexcept
    {
        x.to_bytes(b.template subspan<0, sizeof(FE)>());
        y.to_bytes(b.template subspan<sizeof(FE), sizeof(FE)>());
    }
};

/// Elliptic curve point in Jacobian coordinates (X, Y, Z)
/// representing the affine point (X/Z², Y/Z³). Z = 0 is the point at infinity.
template <typename Curve>
struct ProjPoint
{
    using FE = typename Curve::Fp;
    FE x;
    FE y = FE::one();
    FE z;

    ProjPoint() = default;
    constexpr ProjPoint(const FE& x_, const FE& y_, const FE& z_) noexcept : x{x_}, y{y_}, z{z_} {}
    constexpr explicit ProjPoint(const AffinePoint<Curve>& p) noexcept
      : x{p.x}, y{p.y}, z{FE::one()}
    {}

    friend constexpr bool operator==(const ProjPoint& p, zero_t) noexcept { return p.z == 0; }
};

/// Converts a projected point to an affine point.
template <typename Curve>
inline AffinePoint<Curve> to_affine(const ProjPoint<Curve>& p) noexcept
{
    // The point at infinity (z == 0) maps to (0, 0) because then z_inv == 0.
    const auto z_inv = 1 / p.z;
    const auto zz_inv = z_inv * z_inv;
    return {p.x * zz_inv, p.y * zz_inv * z_inv};
}

/// Elliptic curve point addition in affine coordinates.
template <typename Curve>
AffinePoint<Curve> add(const AffinePoint<Curve>& p, const AffinePoint<Curve>& q) noexcept
{
    if (p == 0)
        return q;
    if (q == 0)
        return p;

    typename Curve::Fp slope;
    if (p.x != q.x)
    {
        slope = (q.y - p.y) / (q.x - p.x);
    }
    else if (p.y == q.y && p.y != 0)
    {
        // Doubling: the slope of the tangent 3x² / 2y.
        const auto xx = p.x * p.x;
        slope = (xx + xx + xx) / (p.y + p.y);
    }
    else
    {
        return {};  // P ⊕ -P
    }

    const auto x3 = slope * slope - p.x - q.x;
    return {x3, slope * (p.x - x3) - p.y};
}

/// Point doubling in Jacobian coordinates of an a=0 curve, the "dbl-2009-l" formula
/// https://www.hyperelliptic.org/EFD/g1p/auto-shortw-jacobian-0.html#doubling-dbl-2009-l
template <typename Curve>
ProjPoint<Curve> dbl(const ProjPoint<Curve>& p) noexcept
{
    static_assert(Curve::A == 0, "only a=0 curves are supported");

    const auto a = p.x * p.x;
    const auto b = p.y * p.y;
    const auto c = b * b;
    const auto xb = p.x + b;
    const auto d2 = xb * xb - a - c;
    const auto d = d2 + d2;
    const auto e = a + a + a;
    const auto c2 = c + c;
    const auto c4 = c2 + c2;
    const auto yz = p.y * p.z;

    const auto x3 = e * e - d - d;
    return {x3, e * (d - x3) - (c4 + c4), yz + yz};
}

/// Mixed addition P ⊕ Q of P in Jacobian coordinates and Q in affine coordinates,
/// the "madd-2007-bl" formula
/// https://www.hyperelliptic.org/EFD/g1p/auto-shortw-jacobian-0.html#addition-madd-2007-bl
///
/// The formula itself fails for P = Q, so that case goes to dbl(). The points at
/// infinity are handled.
template <typename Curve>
ProjPoint<Curve> add(const ProjPoint<Curve>& p, const AffinePoint<Curve>& q) noexcept
{
    if (q == 0)
        return p;
    if (p == 0)
        return ProjPoint(q);

    const auto z1z1 = p.z * p.z;
    const auto u2 = q.x * z1z1;
    const auto s2 = q.y * p.z * z1z1;
    const auto h = u2 - p.x;
    const auto dy = s2 - p.y;
    if (h == 0 && dy == 0) [[unlikely]]
        return dbl(p);

    const auto hh = h * h;
    const auto hh2 = hh + hh;
    const auto i = hh2 + hh2;
    const auto j = h * i;
    const auto r = dy + dy;
    const auto v = p.x * i;
    const auto x3 = r * r - j - v - v;
    const auto y1j = p.y * j;
    const auto z1h = p.z + h;
    return {x3, r * (v - x3) - y1j - y1j, z1h * z1h - z1z1 - hh};
}

/// Computes u×P ⊕ v×Q with a single chain of doublings (the "Straus-Shamir trick",
/// https://eprint.iacr.org/2003/257.pdf#page=7): at each bit position one of ∞, P, Q
/// or P ⊕ Q is added, selected by the pair of scalar bits.
template <typename Curve>
ProjPoint<Curve> msm(const typename Curve::uint_type& u, const AffinePoint<Curve>& p,
    const typename Curve::uint_type& v, const AffinePoint<Curve>& q) noexcept
{
    const AffinePoint<Curve> table[]{{}, p, q, add(p, q)};

    constexpr auto num_bits = sizeof(u) * 8;
    const auto top = num_bits - std::min(intx::clz(u), intx::clz(v));

    ProjPoint<Curve> r;
    for (auto i = top; i != 0; --i)
    {
        const auto index = size_t{bit_test(u, i - 1)} | (size_t{bit_test(v, i - 1)} << 1);
        r = add(dbl(r), table[index]);
    }
    return r;
}

}  // namespace ecproof::ecc
