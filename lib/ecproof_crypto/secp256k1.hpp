// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "ecc.hpp"
#include <evmc/evmc.hpp>
#include <optional>

namespace ecproof::secp256k1
{
using namespace intx;

struct Curve
{
    using uint_type = uint256;

    struct FpSpec
    {
        /// The field prime number (P).
        static constexpr auto ORDER =
            0xfffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f_u256;
    };
    using Fp = ecc::FieldElement<FpSpec>;

    struct FrSpec
    {
        /// The secp256k1 curve group order (N).
        static constexpr auto ORDER =
            0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141_u256;
    };
    using Fr = ecc::FieldElement<FrSpec>;

    static constexpr auto& FIELD_PRIME = FpSpec::ORDER;
    static constexpr auto& ORDER = FrSpec::ORDER;

    static constexpr auto A = 0;
    static constexpr auto B = 7;
};

using AffinePoint = ecc::AffinePoint<Curve>;

/// The generator point.
inline constexpr AffinePoint G{
    0x79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798_u256,
    0x483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8_u256};

/// Checks if the point satisfies y² = x³ + 7. The point at infinity does not.
bool is_on_curve(const AffinePoint& p) noexcept;

/// Square root for secp256k1 prime field.
///
/// Computes √x mod P by computing modular exponentiation x^((P+1)/4).
///
/// @return Square root of x if it exists, std::nullopt otherwise.
std::optional<Curve::Fp> field_sqrt(const Curve::Fp& x) noexcept;

/// Calculate y coordinate of a point having x coordinate and y parity.
std::optional<Curve::Fp> calculate_y(const Curve::Fp& x, bool y_parity) noexcept;

/// Convert the secp256k1 point (uncompressed public key) to Ethereum address.
evmc::address to_address(const AffinePoint& pt) noexcept;

/// Reduces the message hash to a scalar: the 256-bit hash value modulo N.
uint256 hash_to_scalar(const evmc::bytes32& hash) noexcept;

/// Computes R = u₁×G ⊕ u₂×Q of the ECDSA verification with u₁ = zs⁻¹ and u₂ = rs⁻¹,
/// and returns the x coordinate of R reduced modulo N (0 for the point at infinity).
///
/// Requires 0 < r < N and 0 < s < N.
uint256 verification_point_x(
    const evmc::bytes32& hash, const uint256& r, const uint256& s, const AffinePoint& q) noexcept;

/// ECDSA signature verification of (r, s) over the hash for the public key Q.
///
/// Returns false for r or s outside of [1, N-1] and for Q not on the curve.
bool verify(
    const evmc::bytes32& hash, const uint256& r, const uint256& s, const AffinePoint& q) noexcept;

/// Recovers the public key from the signature, the message hash and the parity of R.y.
std::optional<AffinePoint> secp256k1_ecdsa_recover(
    const evmc::bytes32& hash, const uint256& r, const uint256& s, bool parity) noexcept;

/// Recovers the Ethereum address of the signer, as the ECRECOVER precompile does.
std::optional<evmc::address> ecrecover(
    const evmc::bytes32& hash, const uint256& r, const uint256& s, bool parity) noexcept;

}  // namespace ecproof::secp256k1
