// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <intx/intx.hpp>

namespace ecproof
{
/// Returns a⁻¹ mod 2⁶⁴ of an odd a.
constexpr uint64_t inv_mod(uint64_t a) noexcept
{
    // a⋅a = 1 mod 8 for any odd a, so a itself is the inverse to 3 bits.
    // Newton steps double the precision: 6, 12, 24, 48, 96.
    uint64_t inv = a;
    for (int i = 0; i < 5; ++i)
        inv *= 2 - a * inv;
    return inv;
}

/// Arithmetic modulo a prime with values kept in the Montgomery form xR % mod, R = 2^num_bits.
///
/// The modulus must be odd and is fixed at compile time: an even modulus does not compile.
/// Values passed in must be below the modulus.
template <typename UintT>
class ModArith
{
    static constexpr auto S = UintT::num_words;

    const UintT mod_;
    const UintT r_squared_;  ///< R² % mod.
    const uint64_t neg_inv_;  ///< -mod⁻¹ mod 2⁶⁴.

    static consteval const UintT& odd(const UintT& mod) noexcept
    {
        if ((mod[0] & 1) == 0)
            intx::unreachable();
        return mod;
    }

    static constexpr UintT compute_r_squared(const UintT& mod) noexcept
    {
        const UintT r = -mod % mod;  // R % mod
        return intx::udivrem(intx::umul(r, r), mod).rem;
    }

public:
    consteval explicit ModArith(const UintT& mod) noexcept
      : mod_{odd(mod)}, r_squared_{compute_r_squared(mod)}, neg_inv_{0 - inv_mod(mod[0])}
    {}

    /// Montgomery reduction of the (at most double width) value t < mod⋅R: t⋅R⁻¹ % mod.
    ///
    /// Separated from the multiplication: each round adds the multiple of the modulus that
    /// clears the lowest remaining word, then the upper half is the result.
    template <unsigned M>
    constexpr UintT reduce(const intx::uint<M>& t) const noexcept
    {
        static_assert(M <= UintT::num_bits * 2);

        uint64_t acc[2 * S + 1]{};
        for (size_t i = 0; i != intx::uint<M>::num_words; ++i)
            acc[i] = t[i];

        for (size_t i = 0; i != S; ++i)
        {
            const auto m = acc[i] * neg_inv_;
            uint64_t carry = 0;
            for (size_t j = 0; j != S; ++j)
            {
                const auto p = intx::umul(m, mod_[j]) + acc[i + j] + carry;
                acc[i + j] = p[0];
                carry = p[1];
            }
            for (auto k = i + S; carry != 0; ++k)
            {
                const auto s = intx::addc(acc[k], carry);
                acc[k] = s.value;
                carry = s.carry;
            }
        }

        UintT q;
        for (size_t i = 0; i != S; ++i)
            q[i] = acc[S + i];

        // The quotient is below 2⋅mod, acc[2S] is its top bit.
        const auto [d, borrow] = intx::subc(q, mod_);
        return (acc[2 * S] != 0 || !borrow) ? d : q;
    }

    constexpr UintT mul(const UintT& x, const UintT& y) const noexcept
    {
        return reduce(intx::umul(x, y));
    }

    constexpr UintT to_mont(const UintT& x) const noexcept { return mul(x, r_squared_); }

    constexpr UintT from_mont(const UintT& x) const noexcept { return reduce(x); }

    constexpr UintT add(const UintT& x, const UintT& y) const noexcept
    {
        const auto [s, carry] = intx::addc(x, y);
        const auto [d, borrow] = intx::subc(s, mod_);
        return (carry || !borrow) ? d : s;
    }

    constexpr UintT sub(const UintT& x, const UintT& y) const noexcept
    {
        const auto [d, borrow] = intx::subc(x, y);
        return borrow ? d + mod_ : d;
    }
};
}  // namespace ecproof
