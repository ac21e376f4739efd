// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0

#include "constrained.hpp"
#include "encoding.hpp"
#include <ethash/keccak.hpp>
#include <algorithm>

namespace ecproof::constrained
{
namespace
{
/// 3⋅b of the curve equation, the constant of the complete formulas.
constexpr auto B3 = uint256{3 * Curve::B};

Var<Fp> load_coordinate(Trace& trace, const evmc::bytes32& bytes, Bit& in_range) noexcept
{
    const auto [lt, reduced] = reduce(trace, intx::be::load<uint256>(bytes), Curve::FIELD_PRIME);
    in_range = lt;
    return {trace, Fp{reduced}};
}

Var<Fr> load_scalar(Trace& trace, const evmc::bytes32& bytes, Bit& in_range) noexcept
{
    const auto [lt, reduced] = reduce(trace, intx::be::load<uint256>(bytes), Curve::ORDER);
    in_range = lt;
    return {trace, Fr{reduced}};
}

evmc::address hash_to_address(Trace& trace, const Var<Fp>& x, const Var<Fp>& y) noexcept
{
    trace.hash();
    uint8_t serialized[64];
    x.value().to_bytes(std::span<uint8_t, 32>{&serialized[0], 32});
    y.value().to_bytes(std::span<uint8_t, 32>{&serialized[32], 32});
    const auto hashed = ethash::keccak256(serialized, std::size(serialized));

    evmc::address addr;
    std::copy_n(&hashed.bytes[sizeof(hashed) - sizeof(addr)], sizeof(addr), addr.bytes);
    return addr;
}
}  // namespace

std::pair<Bit, uint256> reduce(Trace& trace, const uint256& v, const uint256& bound) noexcept
{
    trace.range_check();
    const auto borrow = intx::subc(v, bound).carry;
    // All ones iff v >= bound.
    const auto mask = uint256{0} - uint256{static_cast<uint64_t>(!borrow)};
    return {Bit{borrow}, v - (bound & mask)};
}

Point infinity(Trace& trace) noexcept
{
    return {Var<Fp>::constant(trace, 0), Var<Fp>::constant(trace, 1), Var<Fp>::constant(trace, 0)};
}

Point from_affine(const Var<Fp>& x, const Var<Fp>& y) noexcept
{
    return {x, y, Var<Fp>::constant(x.trace(), 1)};
}

Point add(const Point& p, const Point& q) noexcept
{
    const auto& [x1, y1, z1] = p;
    const auto& [x2, y2, z2] = q;
    const auto b3 = Var<Fp>::constant(x1.trace(), B3);

    auto t0 = x1 * x2;
    auto t1 = y1 * y2;
    auto t2 = z1 * z2;
    auto t3 = x1 + y1;
    auto t4 = x2 + y2;
    t3 = t3 * t4;
    t4 = t0 + t1;
    t3 = t3 - t4;
    t4 = y1 + z1;
    auto x3 = y2 + z2;
    t4 = t4 * x3;
    x3 = t1 + t2;
    t4 = t4 - x3;
    x3 = x1 + z1;
    auto y3 = x2 + z2;
    x3 = x3 * y3;
    y3 = t0 + t2;
    y3 = x3 - y3;
    x3 = t0 + t0;
    t0 = x3 + t0;
    t2 = b3 * t2;
    auto z3 = t1 + t2;
    t1 = t1 - t2;
    y3 = b3 * y3;
    x3 = t4 * y3;
    t2 = t3 * t1;
    x3 = t2 - x3;
    y3 = y3 * t0;
    t1 = t1 * z3;
    y3 = t1 + y3;
    t0 = t0 * t3;
    z3 = z3 * t4;
    z3 = z3 + t0;
    return {x3, y3, z3};
}

Point select(Bit b, const Point& p, const Point& q) noexcept
{
    return {select(b, p.x, q.x), select(b, p.y, q.y), select(b, p.z, q.z)};
}

Point mul_add(const std::array<Bit, 256>& u1, const std::array<Bit, 256>& u2, const Point& q) noexcept
{
    auto& trace = q.x.trace();
    const auto g = from_affine(Var<Fp>{trace, secp256k1::G.x}, Var<Fp>{trace, secp256k1::G.y});

    auto r = infinity(trace);
    for (auto i = u1.size(); i != 0; --i)
    {
        r = add(r, r);
        r = select(u1[i - 1], add(r, g), r);
        r = select(u2[i - 1], add(r, q), r);
    }
    return r;
}

Evaluation evaluate(const VerificationInput& input) noexcept
{
    Trace trace;
    Intermediates im;

    // Scalars: 0 < r < N, 0 < s < N.
    Bit r_lt_n;
    Bit s_lt_n;
    const auto r = load_scalar(trace, input.signature.r, r_lt_n);
    const auto s = load_scalar(trace, input.signature.s, s_lt_n);
    const auto r_ok = bit_and(trace, r_lt_n, bit_not(trace, is_zero(r)));
    const auto s_ok = bit_and(trace, s_lt_n, bit_not(trace, is_zero(s)));
    const auto signature_in_range = bit_and(trace, r_ok, s_ok);
    im.signature_in_range = static_cast<bool>(signature_in_range);

    // Public key: coordinates below P and on the curve.
    Bit x_lt_p;
    Bit y_lt_p;
    const auto qx = load_coordinate(trace, input.pub_key_x, x_lt_p);
    const auto qy = load_coordinate(trace, input.pub_key_y, y_lt_p);
    const auto public_key_in_range = bit_and(trace, x_lt_p, y_lt_p);
    im.public_key_in_range = static_cast<bool>(public_key_in_range);

    const auto b = Var<Fp>::constant(trace, Curve::B);
    const auto on_curve = is_zero(qy * qy - (qx * qx * qx + b));
    im.public_key_on_curve = static_cast<bool>(on_curve);

    // R = u₁×G ⊕ u₂×Q, u₁ = zs⁻¹, u₂ = rs⁻¹.
    // The digest may be any 256-bit value, it is only reduced modulo N.
    Bit z_lt_n;
    const auto z = load_scalar(trace, input.hashed_message, z_lt_n);
    const auto s_inv = inverse(s);
    const auto u1 = z * s_inv;
    const auto u2 = r * s_inv;
    const auto R = mul_add(to_bits(u1), to_bits(u2), from_affine(qx, qy));

    // x(R) = X/Z, which is 0 for the point at infinity.
    const auto rx = R.x * inverse(R.z);
    const auto rx_mod_n = reduce(trace, rx.value().value(), Curve::ORDER).second;
    im.verification_x = rx_mod_n;

    const auto signature_valid = is_zero(Var<Fr>{trace, Fr{rx_mod_n}} - r);
    im.signature_valid = static_cast<bool>(signature_valid);

    // The address of the public key compared as field elements, as the circuit takes it.
    const auto derived = hash_to_address(trace, qx, qy);
    im.derived_address = derived;
    const auto address_equal =
        is_zero(Var<Fp>::constant(trace, encoding::address_to_field(derived)) -
                Var<Fp>::constant(trace, encoding::address_to_field(input.expected_address)));

    // Decoding the flags into the outcome is the only branching and it happens
    // after the fixed-shape evaluation.
    VerificationOutcome outcome = derived;
    if (!signature_in_range || !public_key_in_range)
        outcome = Reason::malformed_input;
    else if (!on_curve)
        outcome = Reason::point_not_on_curve;
    else if (!signature_valid)
        outcome = Reason::recovery_failed;
    else if (!address_equal)
        outcome = Reason::address_mismatch;

    return {outcome, im, trace.shape()};
}

VerificationOutcome verify_constrained(const VerificationInput& input) noexcept
{
    return evaluate(input).outcome;
}
}  // namespace ecproof::constrained
