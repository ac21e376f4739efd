// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ecproof/ecproof.hpp>
#include <intx/intx.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

/// Conversions between the hex strings of external tooling and the fixed-width inputs.
///
/// All the decoders accept an optional "0x" or "0X" prefix and require the exact number
/// of hex digits for the type.
namespace ecproof::encoding
{
/// The number of hex digits of the 65-byte signature with the trailing recovery byte.
inline constexpr size_t RECOVERABLE_SIGNATURE_HEX_SIZE = 130;

/// Removes the optional "0x" or "0X" prefix.
std::string_view strip_hex_prefix(std::string_view hex) noexcept;

/// Decodes a 32-byte value (a coordinate or a digest) from exactly 64 hex digits.
std::optional<evmc::bytes32> decode_bytes32(std::string_view hex) noexcept;

/// Decodes a 20-byte address from exactly 40 hex digits.
std::optional<evmc::address> decode_address(std::string_view hex) noexcept;

/// Decodes the 64-byte signature r || s.
///
/// The 65-byte form r || s || v (130 hex digits) is also accepted:
/// the trailing recovery byte v is stripped before decoding.
std::optional<Signature> decode_signature(std::string_view hex) noexcept;

/// Returns the parity of R.y encoded in the recovery byte of the 65-byte signature.
///
/// The byte may be 27/28 (Ethereum's v) or 0/1. Returns std::nullopt for other values
/// and for signatures without the recovery byte.
std::optional<bool> recovery_parity(std::string_view hex) noexcept;

/// Splits the uncompressed SEC1 public key 0x04 || X || Y into the coordinates.
std::optional<std::pair<evmc::bytes32, evmc::bytes32>> decode_public_key(
    std::string_view hex) noexcept;

/// Decodes all the inputs. Any failure makes the whole input malformed.
std::optional<VerificationInput> decode_input(const HexInput& input) noexcept;

/// The address as the field element (big-endian integer) the circuit takes it in.
intx::uint256 address_to_field(const evmc::address& addr) noexcept;

/// The address of the field element. Returns std::nullopt for values >= 2¹⁶⁰.
std::optional<evmc::address> address_from_field(const intx::uint256& value) noexcept;

/// Renders the inputs in the Prover.toml layout of the circuit:
/// the byte arrays as lists of decimal numbers, the address as the hex field value.
std::string to_prover_inputs(const VerificationInput& input);
}  // namespace ecproof::encoding
