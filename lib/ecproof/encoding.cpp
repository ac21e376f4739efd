// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0

#include "encoding.hpp"
#include <evmc/hex.hpp>
#include <algorithm>
#include <span>

namespace ecproof::encoding
{
namespace
{
/// Decodes exactly out.size() bytes from hex digits without the prefix.
bool decode_exact(std::string_view digits, std::span<uint8_t> out) noexcept
{
    // evmc::from_hex() skips a "0x" of its own, so a second prefix would pass as digits.
    if (digits.size() != 2 * out.size() || digits.starts_with("0x"))
        return false;
    return evmc::from_hex(digits, out.data());
}

void append_byte_list(std::string& out, std::string_view name, std::span<const uint8_t> bytes)
{
    out += name;
    out += " = [";
    for (size_t i = 0; i < bytes.size(); ++i)
    {
        if (i != 0)
            out += ", ";
        out += std::to_string(bytes[i]);
    }
    out += "]\n";
}
}  // namespace

std::string_view strip_hex_prefix(std::string_view hex) noexcept
{
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        hex.remove_prefix(2);
    return hex;
}

std::optional<evmc::bytes32> decode_bytes32(std::string_view hex) noexcept
{
    evmc::bytes32 value;
    if (!decode_exact(strip_hex_prefix(hex), value.bytes))
        return std::nullopt;
    return value;
}

std::optional<evmc::address> decode_address(std::string_view hex) noexcept
{
    evmc::address addr;
    if (!decode_exact(strip_hex_prefix(hex), addr.bytes))
        return std::nullopt;
    return addr;
}

std::optional<Signature> decode_signature(std::string_view hex) noexcept
{
    auto digits = strip_hex_prefix(hex);
    if (digits.size() == RECOVERABLE_SIGNATURE_HEX_SIZE)
    {
        // The recovery byte must still be a valid hex byte.
        uint8_t v = 0;
        if (!decode_exact(digits.substr(RECOVERABLE_SIGNATURE_HEX_SIZE - 2), {&v, 1}))
            return std::nullopt;
        digits.remove_suffix(2);
    }

    uint8_t bytes[64];
    if (!decode_exact(digits, bytes))
        return std::nullopt;

    Signature sig;
    std::copy_n(&bytes[0], sizeof(sig.r), sig.r.bytes);
    std::copy_n(&bytes[32], sizeof(sig.s), sig.s.bytes);
    return sig;
}

std::optional<bool> recovery_parity(std::string_view hex) noexcept
{
    uint8_t bytes[RECOVERABLE_SIGNATURE_HEX_SIZE / 2];
    if (!decode_exact(strip_hex_prefix(hex), bytes))
        return std::nullopt;

    switch (bytes[64])
    {
    case 0:
    case 27:
        return false;
    case 1:
    case 28:
        return true;
    default:
        return std::nullopt;
    }
}

std::optional<std::pair<evmc::bytes32, evmc::bytes32>> decode_public_key(
    std::string_view hex) noexcept
{
    uint8_t bytes[65];
    if (!decode_exact(strip_hex_prefix(hex), bytes))
        return std::nullopt;

    // Only the uncompressed form is accepted.
    if (bytes[0] != 0x04)
        return std::nullopt;

    std::pair<evmc::bytes32, evmc::bytes32> coords;
    std::copy_n(&bytes[1], 32, coords.first.bytes);
    std::copy_n(&bytes[33], 32, coords.second.bytes);
    return coords;
}

std::optional<VerificationInput> decode_input(const HexInput& input) noexcept
{
    const auto pub_key_x = decode_bytes32(input.pub_key_x);
    const auto pub_key_y = decode_bytes32(input.pub_key_y);
    const auto signature = decode_signature(input.signature);
    const auto hashed_message = decode_bytes32(input.hashed_message);
    const auto expected_address = decode_address(input.expected_address);
    if (!pub_key_x || !pub_key_y || !signature || !hashed_message || !expected_address)
        return std::nullopt;

    return VerificationInput{
        *pub_key_x, *pub_key_y, *signature, *hashed_message, *expected_address};
}

intx::uint256 address_to_field(const evmc::address& addr) noexcept
{
    return intx::be::load<intx::uint256>(addr);
}

std::optional<evmc::address> address_from_field(const intx::uint256& value) noexcept
{
    if ((value >> 160) != 0)
        return std::nullopt;

    return intx::be::trunc<evmc::address>(value);
}

std::string to_prover_inputs(const VerificationInput& input)
{
    std::string out;
    out += "expected_address = \"0x" +
           evmc::hex({input.expected_address.bytes, sizeof(input.expected_address.bytes)}) +
           "\"\n";
    append_byte_list(out, "hashed_message", input.hashed_message.bytes);
    append_byte_list(out, "pub_key_x", input.pub_key_x.bytes);
    append_byte_list(out, "pub_key_y", input.pub_key_y.bytes);

    uint8_t signature[64];
    std::copy_n(input.signature.r.bytes, 32, &signature[0]);
    std::copy_n(input.signature.s.bytes, 32, &signature[32]);
    append_byte_list(out, "signature", signature);
    return out;
}
}  // namespace ecproof::encoding
