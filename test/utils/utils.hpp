// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ecproof/ecproof.hpp>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

struct secp256k1_context_struct;

namespace ecproof::test
{
using evmc::bytes;
using evmc::bytes_view;

/// Decodes the hex string ignoring whitespace.
std::optional<bytes> from_spaced_hex(std::string_view hex) noexcept;

inline std::string hex(const evmc::address& addr)
{
    return evmc::hex({addr.bytes, sizeof(addr.bytes)});
}

inline std::string hex(const evmc::bytes32& value)
{
    return evmc::hex({value.bytes, sizeof(value.bytes)});
}

inline std::string hex(const intx::uint256& value)
{
    return intx::hex(value);
}

/// Keccak-256 of the text.
evmc::bytes32 keccak256(std::string_view text) noexcept;

/// The signature of keccak256("hello") by the key
/// 0x6bde6b9de8d62915bad5fe7dc19c0c9b61554fec26aa7656478d2557fb75ef34.
namespace hello
{
using namespace evmc::literals;

inline constexpr auto SECRET_KEY =
    0x6bde6b9de8d62915bad5fe7dc19c0c9b61554fec26aa7656478d2557fb75ef34_bytes32;
inline constexpr auto PUB_KEY_X =
    0xcb914752fc33f97cc132cd4f0f56f18bfdcb838a5b63ca42d109f29c0c1c6952_bytes32;
inline constexpr auto PUB_KEY_Y =
    0x6c0c3975bca2cc6a98771cf82c60c15d3effe4155ace594a7eab1106edaa10ba_bytes32;
inline constexpr auto R =
    0xb2c9080446b5034e8ef4a1cdc0314efcc2865594a56e7a4efe3684fc2b2c1fbd_bytes32;
inline constexpr auto S =
    0x2a2e74a6a38948af3720bb4aa06cc5de6ccb1a66d339d173a15d437522477345_bytes32;
inline constexpr auto HASHED_MESSAGE =
    0x1c8aff950685c2ed4bc3174f3472287b56d9517b9c948127319a09a7a36deac8_bytes32;
inline constexpr auto ADDRESS =
    0x30722096aa6ff8300159817784d4643bf78c8328_address;

/// The 65-byte signature with the recovery byte as returned by wallets.
inline constexpr std::string_view SIGNATURE_HEX =
    "0xb2c9080446b5034e8ef4a1cdc0314efcc2865594a56e7a4efe3684fc2b2c1fbd"
    "2a2e74a6a38948af3720bb4aa06cc5de6ccb1a66d339d173a15d4375224773451c";

VerificationInput input() noexcept;
}  // namespace hello

/// A signature produced by the reference implementation.
struct SignedMessage
{
    VerificationInput input;

    /// The parity of R.y, the recovery id.
    bool parity = false;
};

/// Signs with libsecp256k1, the reference the verification is checked against.
class Signer
{
    secp256k1_context_struct* ctx_;

public:
    Signer();
    ~Signer();

    Signer(const Signer&) = delete;
    Signer& operator=(const Signer&) = delete;

    /// Returns a valid secret key drawn from the generator.
    evmc::bytes32 random_secret_key(std::mt19937_64& rng) const;

    /// Signs the digest. The expected address is the address of the key.
    SignedMessage sign(const evmc::bytes32& secret_key, const evmc::bytes32& digest) const;
};

/// Draws 32 random bytes.
evmc::bytes32 random_bytes32(std::mt19937_64& rng) noexcept;
}  // namespace ecproof::test
