// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1.hpp"
#include <ethash/keccak.hpp>
#include <algorithm>

namespace ecproof::secp256k1
{
namespace
{
using Fp = Curve::Fp;
using Fr = Curve::Fr;

constexpr Fp B{Curve::B};
}  // namespace

static_assert(AffinePoint{} == 0, "default constructed is the point at infinity");

bool is_on_curve(const AffinePoint& p) noexcept
{
    return p.y * p.y == p.x * p.x * p.x + B;
}

std::optional<Fp> field_sqrt(const Fp& x) noexcept
{
    // P ≡ 3 (mod 4) so the root candidate is x^((P+1)/4).
    static constexpr auto EXPONENT = (Curve::FIELD_PRIME + 1) / 4;
    const auto r = ecc::pow(x, EXPONENT);
    if (r * r != x)
        return std::nullopt;
    return r;
}

std::optional<Fp> calculate_y(const Fp& x, bool y_parity) noexcept
{
    const auto y = field_sqrt(x * x * x + B);
    if (!y.has_value())
        return std::nullopt;

    const auto candidate_parity = (y->value() & 1) != 0;
    return candidate_parity == y_parity ? *y : -*y;
}

evmc::address to_address(const AffinePoint& pt) noexcept
{
    uint8_t serialized[64];
    pt.to_bytes(serialized);

    const auto hashed = ethash::keccak256(serialized, std::size(serialized));
    evmc::address addr;
    std::copy_n(&hashed.bytes[sizeof(hashed) - sizeof(addr)], sizeof(addr), addr.bytes);
    return addr;
}

uint256 hash_to_scalar(const evmc::bytes32& hash) noexcept
{
    // 2²⁵⁶ < 2N so a single subtraction reduces the hash value.
    static_assert(Curve::ORDER > 1_u256 << 255);
    auto z = be::unsafe::load<uint256>(hash.bytes);
    if (z >= Curve::ORDER)
        z -= Curve::ORDER;
    return z;
}

uint256 verification_point_x(
    const evmc::bytes32& hash, const uint256& r, const uint256& s, const AffinePoint& q) noexcept
{
    const auto z = Fr{hash_to_scalar(hash)};
    const auto s_inv = 1 / Fr{s};
    const auto u1 = (z * s_inv).value();
    const auto u2 = (Fr{r} * s_inv).value();

    const auto R = ecc::to_affine(ecc::msm(u1, G, u2, q));

    // The point at infinity maps to (0, 0) and the x coordinate 0 never matches r.
    auto x1 = R.x.value();
    if (x1 >= Curve::ORDER)
        x1 -= Curve::ORDER;
    return x1;
}

bool verify(
    const evmc::bytes32& hash, const uint256& r, const uint256& s, const AffinePoint& q) noexcept
{
    // https://en.wikipedia.org/wiki/Elliptic_Curve_Digital_Signature_Algorithm#Signature_verification_algorithm
    if (r == 0 || r >= Curve::ORDER || s == 0 || s >= Curve::ORDER)
        return false;

    if (!is_on_curve(q))
        return false;

    return verification_point_x(hash, r, s, q) == r;
}

std::optional<AffinePoint> secp256k1_ecdsa_recover(
    const evmc::bytes32& hash, const uint256& r, const uint256& s, bool parity) noexcept
{
    if (r == 0 || r >= Curve::ORDER || s == 0 || s >= Curve::ORDER)
        return std::nullopt;

    // The x coordinate of R is r. The case of x = r + N (possible because P > N) is ignored
    // the same way the ECRECOVER precompile ignores it.
    const auto y = calculate_y(Fp{r}, parity);
    if (!y.has_value())
        return std::nullopt;
    const AffinePoint R{Fp{r}, *y};

    // Q = r⁻¹(sR - zG) = u₁G + u₂R with u₁ = -zr⁻¹ and u₂ = sr⁻¹.
    const auto z = Fr{hash_to_scalar(hash)};
    const auto r_inv = 1 / Fr{r};
    const auto u1 = (-(z * r_inv)).value();
    const auto u2 = (Fr{s} * r_inv).value();

    const auto Q = ecc::msm(u1, G, u2, R);
    if (Q == 0)
        return std::nullopt;
    return ecc::to_affine(Q);
}

std::optional<evmc::address> ecrecover(
    const evmc::bytes32& hash, const uint256& r, const uint256& s, bool parity) noexcept
{
    const auto point = secp256k1_ecdsa_recover(hash, r, s, parity);
    if (!point.has_value())
        return std::nullopt;

    return to_address(*point);
}
}  // namespace ecproof::secp256k1
