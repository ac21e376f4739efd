// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0

#include <ecproof/recovery.hpp>
#include <ecproof_crypto/secp256k1.hpp>
#include <gtest/gtest.h>
#include <test/utils/utils.hpp>

using namespace ecproof;
using namespace evmc::literals;
using namespace intx;
namespace hello = ecproof::test::hello;
using secp256k1::Curve;

namespace
{
evmc::bytes32 to_bytes32(const uint256& v) noexcept
{
    return be::store<evmc::bytes32>(v);
}

void flip_bit(evmc::bytes32& v, size_t i) noexcept
{
    v.bytes[i / 8] ^= static_cast<uint8_t>(1 << (i % 8));
}
}  // namespace

TEST(recovery, valid)
{
    EXPECT_EQ(verify(hello::input()), VerificationOutcome{hello::ADDRESS});
    EXPECT_EQ(verify_native(hello::input()), VerificationOutcome{hello::ADDRESS});
}

TEST(recovery, valid_key_one)
{
    // The secret key 1 signing keccak256("ecproof").
    const VerificationInput input{
        0x79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798_bytes32,
        0x483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8_bytes32,
        {
            0x3be7f1dd723edd778f8709643bda80832d7cf275ff178d9d34c0a08c062072b2_bytes32,
            0x0a064284d2d1801e73648be54ffb6025d09fd62b52edc310a9ab7f654ea0a4e8_bytes32,
        },
        test::keccak256("ecproof"),
        0x7e5f4552091a69125d5dfcb7b8c2659029395bdf_address,
    };
    EXPECT_EQ(input.hashed_message,
        0xe00a06f84c28634156c5eaac8072227080143dea3e16628799a7148ba6ca31f4_bytes32);
    EXPECT_EQ(verify(input), VerificationOutcome{input.expected_address});
}

TEST(recovery, valid_message_signature)
{
    // The signature of keccak256("I control this address").
    const VerificationInput input{
        0x0947751e3022ecf3016be03ec77ab0ce3c2662b4843898cb068d74f698ccc8ad_bytes32,
        0x75aa17564ae80a20bb044ee7a6d903e8e8df624b089c95d66a0570f051e5a05b_bytes32,
        {
            0x2435d652c551c54adfad7318302552b8dd5f5aa9e370d8f7caa3c44341588c89_bytes32,
            0x7a6a49bb02bb599fdb9c8248e5a7b92f1637c6c08b794d929bcc702214e5bb25_bytes32,
        },
        test::keccak256("I control this address"),
        0xcd2a3d9f938e13cd947ec05abc7fe734df8dd826_address,
    };
    EXPECT_EQ(input.hashed_message,
        0xf19a90361f7496d1c00d2b2f2f21184010abaf6185efed3b183380aafe3048da_bytes32);
    EXPECT_EQ(verify(input), VerificationOutcome{input.expected_address});
}

TEST(recovery, address_mismatch)
{
    auto input = hello::input();
    input.expected_address = 0x0000000000000000000000000000000000000001_address;
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::address_mismatch});

    input.expected_address = hello::ADDRESS;
    input.expected_address.bytes[19] ^= 1;
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::address_mismatch});

    input.expected_address = evmc::address{};
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::address_mismatch});
}

TEST(recovery, digest_changed)
{
    auto input = hello::input();
    input.hashed_message.bytes[0] ^= 0x01;
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::recovery_failed});

    input.hashed_message = test::keccak256("hello!");
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::recovery_failed});
}

TEST(recovery, other_public_key)
{
    // A valid key which did not sign the message.
    auto input = hello::input();
    input.pub_key_x = to_bytes32(secp256k1::G.x.value());
    input.pub_key_y = to_bytes32(secp256k1::G.y.value());
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::recovery_failed});
}

TEST(recovery, scalar_boundaries)
{
    for (const auto& v : {0_u256, Curve::ORDER, Curve::ORDER + 1, ~uint256{}})
    {
        auto input = hello::input();
        input.signature.r = to_bytes32(v);
        EXPECT_EQ(verify(input), VerificationOutcome{Reason::malformed_input}) << hex(v);

        input = hello::input();
        input.signature.s = to_bytes32(v);
        EXPECT_EQ(verify(input), VerificationOutcome{Reason::malformed_input}) << hex(v);
    }

    auto input = hello::input();
    input.signature = {};
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::malformed_input});
}

TEST(recovery, scalar_upper_bound_in_range)
{
    // N-1 is a valid scalar: the signature does not verify but it is not malformed.
    auto input = hello::input();
    input.signature.s = to_bytes32(Curve::ORDER - 1);
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::recovery_failed});

    input = hello::input();
    input.signature.r = to_bytes32(1);
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::recovery_failed});
}

TEST(recovery, high_s_accepted)
{
    auto input = hello::input();
    input.signature.s = to_bytes32(Curve::ORDER - be::load<uint256>(input.signature.s));
    EXPECT_EQ(verify(input), VerificationOutcome{hello::ADDRESS});
}

TEST(recovery, point_not_on_curve)
{
    auto input = hello::input();
    input.pub_key_y = to_bytes32(be::load<uint256>(input.pub_key_y) + 1);
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::point_not_on_curve});

    // The point at infinity has no affine encoding.
    input.pub_key_x = {};
    input.pub_key_y = {};
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::point_not_on_curve});
}

TEST(recovery, coordinate_out_of_range)
{
    for (const auto& v : {Curve::FIELD_PRIME, Curve::FIELD_PRIME + 1, ~uint256{}})
    {
        auto input = hello::input();
        input.pub_key_x = to_bytes32(v);
        EXPECT_EQ(verify(input), VerificationOutcome{Reason::malformed_input}) << hex(v);

        input = hello::input();
        input.pub_key_y = to_bytes32(v);
        EXPECT_EQ(verify(input), VerificationOutcome{Reason::malformed_input}) << hex(v);
    }

    // The non-canonical encoding x + P of the coordinate x.
    const auto small_x = 1_u256;
    const auto y = secp256k1::calculate_y(Curve::Fp{small_x}, false);
    ASSERT_TRUE(y.has_value());
    auto input = hello::input();
    input.pub_key_x = to_bytes32(small_x + Curve::FIELD_PRIME);
    input.pub_key_y = to_bytes32(y->value());
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::malformed_input});
}

TEST(recovery, malformed_before_not_on_curve)
{
    // Both the signature and the key are bad: the range check is reported.
    auto input = hello::input();
    input.signature.r = {};
    input.pub_key_y = to_bytes32(be::load<uint256>(input.pub_key_y) + 1);
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::malformed_input});
}

TEST(recovery, not_on_curve_before_recovery_failed)
{
    auto input = hello::input();
    input.hashed_message.bytes[31] ^= 0x80;
    input.pub_key_y = to_bytes32(be::load<uint256>(input.pub_key_y) + 1);
    EXPECT_EQ(verify(input), VerificationOutcome{Reason::point_not_on_curve});
}

TEST(recovery, idempotent)
{
    auto input = hello::input();
    const auto first = verify(input);
    EXPECT_EQ(verify(input), first);
    EXPECT_EQ(verify(input), first);

    input.hashed_message.bytes[7] ^= 0x10;
    const auto failed = verify(input);
    EXPECT_EQ(verify(input), failed);
}

TEST(recovery, single_bit_flips)
{
    const auto expect_all_flips_invalid = [](auto&& field) {
        for (size_t i = 0; i < 256; ++i)
        {
            auto input = hello::input();
            flip_bit(field(input), i);
            EXPECT_FALSE(is_valid(verify(input))) << i;
        }
    };

    expect_all_flips_invalid([](VerificationInput& in) -> auto& { return in.signature.r; });
    expect_all_flips_invalid([](VerificationInput& in) -> auto& { return in.signature.s; });
    expect_all_flips_invalid([](VerificationInput& in) -> auto& { return in.hashed_message; });
    expect_all_flips_invalid([](VerificationInput& in) -> auto& { return in.pub_key_x; });
    expect_all_flips_invalid([](VerificationInput& in) -> auto& { return in.pub_key_y; });

    for (size_t i = 0; i < 160; ++i)
    {
        auto input = hello::input();
        input.expected_address.bytes[i / 8] ^= static_cast<uint8_t>(1 << (i % 8));
        EXPECT_EQ(verify(input), VerificationOutcome{Reason::address_mismatch}) << i;
    }
}

TEST(recovery, intermediates)
{
    Intermediates im;
    EXPECT_EQ(verify_native(hello::input(), &im), VerificationOutcome{hello::ADDRESS});
    EXPECT_EQ(im.signature_in_range, true);
    EXPECT_EQ(im.public_key_in_range, true);
    EXPECT_EQ(im.public_key_on_curve, true);
    EXPECT_EQ(im.verification_x, be::load<uint256>(hello::R));
    EXPECT_EQ(im.signature_valid, true);
    EXPECT_EQ(im.derived_address, hello::ADDRESS);
}

TEST(recovery, intermediates_stop_at_first_failure)
{
    auto input = hello::input();
    input.pub_key_y = to_bytes32(be::load<uint256>(input.pub_key_y) + 1);

    Intermediates im;
    EXPECT_EQ(verify_native(input, &im), VerificationOutcome{Reason::point_not_on_curve});
    EXPECT_EQ(im.signature_in_range, true);
    EXPECT_EQ(im.public_key_in_range, true);
    EXPECT_EQ(im.public_key_on_curve, false);
    EXPECT_FALSE(im.verification_x.has_value());
    EXPECT_FALSE(im.signature_valid.has_value());
    EXPECT_FALSE(im.derived_address.has_value());
}

TEST(recovery, recover_address_without_expected_address)
{
    const auto in = hello::input();
    EXPECT_EQ(recover_address(in.pub_key_x, in.pub_key_y, in.signature, in.hashed_message),
        VerificationOutcome{hello::ADDRESS});
}

TEST(recovery, check_address)
{
    const VerificationOutcome recovered{hello::ADDRESS};
    EXPECT_EQ(check_address(recovered, hello::ADDRESS), recovered);
    EXPECT_EQ(check_address(recovered, evmc::address{}),
        VerificationOutcome{Reason::address_mismatch});

    // Failures pass through unchanged, whatever the expected address.
    for (const auto reason :
        {Reason::malformed_input, Reason::point_not_on_curve, Reason::recovery_failed})
    {
        EXPECT_EQ(check_address(reason, hello::ADDRESS), VerificationOutcome{reason});
        EXPECT_EQ(check_address(reason, evmc::address{}), VerificationOutcome{reason});
    }
}

TEST(recovery, ecrecover_agrees)
{
    const auto r = be::load<uint256>(hello::R);
    const auto s = be::load<uint256>(hello::S);
    EXPECT_EQ(secp256k1::ecrecover(hello::HASHED_MESSAGE, r, s, true), hello::ADDRESS);

    // The wrong parity recovers a different signer.
    const auto other = secp256k1::ecrecover(hello::HASHED_MESSAGE, r, s, false);
    ASSERT_TRUE(other.has_value());
    EXPECT_NE(*other, hello::ADDRESS);
}

TEST(recovery, hex_input)
{
    HexInput hex{
        "0xcb914752fc33f97cc132cd4f0f56f18bfdcb838a5b63ca42d109f29c0c1c6952",
        "0x6c0c3975bca2cc6a98771cf82c60c15d3effe4155ace594a7eab1106edaa10ba",
        std::string{hello::SIGNATURE_HEX},
        "0x1c8aff950685c2ed4bc3174f3472287b56d9517b9c948127319a09a7a36deac8",
        "0x30722096aa6ff8300159817784d4643bf78c8328",
    };
    EXPECT_EQ(verify(hex), VerificationOutcome{hello::ADDRESS});
    EXPECT_EQ(verify(hex, Mode::constrained), VerificationOutcome{hello::ADDRESS});

    hex.expected_address = "0x30722096aa6ff8300159817784d4643bf78c832";
    EXPECT_EQ(verify(hex), VerificationOutcome{Reason::malformed_input});
    EXPECT_EQ(verify(hex, Mode::constrained), VerificationOutcome{Reason::malformed_input});
}

TEST(recovery, reason_names)
{
    EXPECT_EQ(to_string(Reason::malformed_input), "malformed_input");
    EXPECT_EQ(to_string(Reason::point_not_on_curve), "point_not_on_curve");
    EXPECT_EQ(to_string(Reason::recovery_failed), "recovery_failed");
    EXPECT_EQ(to_string(Reason::address_mismatch), "address_mismatch");
    EXPECT_EQ(to_string(Mode::native), "native");
    EXPECT_EQ(to_string(Mode::constrained), "constrained");
}
