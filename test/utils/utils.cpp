// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0

#include "utils.hpp"
#include <ethash/keccak.hpp>
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ecproof::test
{
std::optional<bytes> from_spaced_hex(std::string_view hex) noexcept
{
    std::string s;
    s.reserve(hex.size());
    for (const auto c : hex)
    {
        if (std::isspace(static_cast<unsigned char>(c)) == 0)
            s.push_back(c);
    }
    return evmc::from_hex(s);
}

evmc::bytes32 keccak256(std::string_view text) noexcept
{
    const auto h =
        ethash::keccak256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    evmc::bytes32 digest;
    std::copy_n(h.bytes, sizeof(h.bytes), digest.bytes);
    return digest;
}

VerificationInput hello::input() noexcept
{
    return {PUB_KEY_X, PUB_KEY_Y, {R, S}, HASHED_MESSAGE, ADDRESS};
}

Signer::Signer() : ctx_{secp256k1_context_create(SECP256K1_CONTEXT_NONE)}
{
    if (ctx_ == nullptr)
        throw std::runtime_error{"secp256k1_context_create failed"};
}

Signer::~Signer()
{
    secp256k1_context_destroy(ctx_);
}

evmc::bytes32 Signer::random_secret_key(std::mt19937_64& rng) const
{
    while (true)
    {
        const auto key = random_bytes32(rng);
        if (secp256k1_ec_seckey_verify(ctx_, key.bytes) == 1)
            return key;
    }
}

SignedMessage Signer::sign(const evmc::bytes32& secret_key, const evmc::bytes32& digest) const
{
    secp256k1_ecdsa_recoverable_signature sig;
    if (secp256k1_ecdsa_sign_recoverable(ctx_, &sig, digest.bytes, secret_key.bytes, nullptr,
            nullptr) != 1)
        throw std::invalid_argument{"invalid secret key"};

    uint8_t compact[64];
    int recid = 0;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx_, compact, &recid, &sig);

    secp256k1_pubkey pk;
    if (secp256k1_ec_pubkey_create(ctx_, &pk, secret_key.bytes) != 1)
        throw std::invalid_argument{"invalid secret key"};

    uint8_t pubkey[65];
    auto pubkey_size = sizeof(pubkey);
    secp256k1_ec_pubkey_serialize(ctx_, pubkey, &pubkey_size, &pk, SECP256K1_EC_UNCOMPRESSED);

    SignedMessage signed_message;
    auto& in = signed_message.input;
    std::copy_n(&compact[0], 32, in.signature.r.bytes);
    std::copy_n(&compact[32], 32, in.signature.s.bytes);
    std::copy_n(&pubkey[1], 32, in.pub_key_x.bytes);
    std::copy_n(&pubkey[33], 32, in.pub_key_y.bytes);
    in.hashed_message = digest;

    // The address is computed here from the serialized key, independently of the library.
    const auto h = ethash::keccak256(&pubkey[1], 64);
    std::copy_n(&h.bytes[12], sizeof(in.expected_address.bytes), in.expected_address.bytes);

    signed_message.parity = recid == 1;
    return signed_message;
}

evmc::bytes32 random_bytes32(std::mt19937_64& rng) noexcept
{
    evmc::bytes32 value;
    for (size_t i = 0; i < sizeof(value.bytes); i += 8)
    {
        const auto word = rng();
        for (size_t j = 0; j < 8; ++j)
            value.bytes[i + j] = static_cast<uint8_t>(word >> (8 * j));
    }
    return value;
}
}  // namespace ecproof::test
