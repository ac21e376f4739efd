// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0

#include "verify_tool.hpp"
#include <ecproof/cross_check.hpp>
#include <ecproof/ecproof.hpp>
#include <ecproof/encoding.hpp>
#include <ecproof_crypto/secp256k1.hpp>
#include <evmc/hex.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>

namespace ecproof::verify_tool
{
namespace
{
constexpr auto USAGE = R"(Usage: ecproof-verify [options]

Inputs (either --input or the individual values):
  --input FILE               JSON object or array of objects with the keys
                             pub_key_x, pub_key_y (or public_key), signature,
                             hashed_message, expected_address
  --pub-key-x HEX            public key X coordinate (32 bytes)
  --pub-key-y HEX            public key Y coordinate (32 bytes)
  --public-key HEX           uncompressed public key 0x04 || X || Y
  --signature HEX            r || s (64 bytes), optionally followed by the recovery byte
  --hashed-message HEX       the signed digest (32 bytes)
  --expected-address HEX     the address to prove (20 bytes)

Options:
  --mode native|constrained  the evaluation context (default: native)
  --cross-check              evaluate in both contexts and require them to agree
  --ecrecover                also print the address recovered with the recovery byte
  --prover-toml              print the inputs in the Prover.toml layout
  --help                     print this message
)";

/// A single verification case as supplied on the command line or in the input file.
struct Case
{
    HexInput hex;
    std::optional<std::string> public_key;

    bool empty() const noexcept
    {
        return !public_key.has_value() && hex.pub_key_x.empty() && hex.pub_key_y.empty() &&
               hex.signature.empty() && hex.hashed_message.empty() &&
               hex.expected_address.empty();
    }
};

struct Options
{
    std::string input_file;
    Case single;
    Mode mode = Mode::native;
    bool cross_check = false;
    bool ecrecover = false;
    bool prover_toml = false;
    bool help = false;
};

Mode parse_mode(std::string_view name)
{
    if (name == "native")
        return Mode::native;
    if (name == "constrained")
        return Mode::constrained;
    throw std::invalid_argument{"unknown mode: " + std::string{name}};
}

Options parse_args(const std::vector<std::string>& args)
{
    Options opts;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args[i];

        const auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size())
                throw std::invalid_argument{"missing value for " + std::string{arg}};
            return args[++i];
        };

        if (arg == "--help")
            opts.help = true;
        else if (arg == "--input")
            opts.input_file = value();
        else if (arg == "--pub-key-x")
            opts.single.hex.pub_key_x = value();
        else if (arg == "--pub-key-y")
            opts.single.hex.pub_key_y = value();
        else if (arg == "--public-key")
            opts.single.public_key = value();
        else if (arg == "--signature")
            opts.single.hex.signature = value();
        else if (arg == "--hashed-message")
            opts.single.hex.hashed_message = value();
        else if (arg == "--expected-address")
            opts.single.hex.expected_address = value();
        else if (arg == "--mode")
            opts.mode = parse_mode(value());
        else if (arg == "--cross-check")
            opts.cross_check = true;
        else if (arg == "--ecrecover")
            opts.ecrecover = true;
        else if (arg == "--prover-toml")
            opts.prover_toml = true;
        else
            throw std::invalid_argument{"unknown option: " + std::string{arg}};
    }

    if (!opts.help && opts.input_file.empty() && opts.single.empty())
        throw std::invalid_argument{"no input"};
    return opts;
}

Case case_from_json(const nlohmann::json& j)
{
    Case c;
    if (j.contains("public_key"))
    {
        c.public_key = j.at("public_key").get<std::string>();
    }
    else
    {
        c.hex.pub_key_x = j.at("pub_key_x").get<std::string>();
        c.hex.pub_key_y = j.at("pub_key_y").get<std::string>();
    }
    c.hex.signature = j.at("signature").get<std::string>();
    c.hex.hashed_message = j.at("hashed_message").get<std::string>();
    c.hex.expected_address = j.at("expected_address").get<std::string>();
    return c;
}

std::vector<Case> load_cases(const std::string& path)
{
    std::ifstream file{path};
    if (!file.is_open())
        throw std::runtime_error{"cannot open input file: " + path};

    const auto j = nlohmann::json::parse(file);
    std::vector<Case> cases;
    if (j.is_array())
    {
        for (const auto& item : j)
            cases.emplace_back(case_from_json(item));
    }
    else
    {
        cases.emplace_back(case_from_json(j));
    }
    return cases;
}

std::string to_hex(std::span<const uint8_t> bytes)
{
    return "0x" + evmc::hex({bytes.data(), bytes.size()});
}

void print_outcome(std::ostream& out, const VerificationOutcome& outcome)
{
    if (const auto* addr = std::get_if<evmc::address>(&outcome))
        out << "valid " << to_hex(addr->bytes) << '\n';
    else
        out << "invalid " << to_string(std::get<Reason>(outcome)) << '\n';
}

void print_ecrecover(std::ostream& out, const HexInput& hex, const VerificationInput& input)
{
    const auto parity = encoding::recovery_parity(hex.signature);
    if (!parity.has_value())
    {
        out << "ecrecover: no recovery byte\n";
        return;
    }

    const auto r = intx::be::load<intx::uint256>(input.signature.r);
    const auto s = intx::be::load<intx::uint256>(input.signature.s);
    const auto addr = secp256k1::ecrecover(input.hashed_message, r, s, *parity);
    if (addr.has_value())
        out << "ecrecover: " << to_hex(addr->bytes) << '\n';
    else
        out << "ecrecover: failed\n";
}

/// Runs a single case and returns its exit code.
int run_case(const Case& c, const Options& opts, std::ostream& out, std::ostream& err)
{
    auto hex = c.hex;
    if (c.public_key.has_value())
    {
        const auto coords = encoding::decode_public_key(*c.public_key);
        if (!coords.has_value())
        {
            print_outcome(out, Reason::malformed_input);
            return EXIT_INVALID;
        }
        hex.pub_key_x = to_hex(coords->first.bytes);
        hex.pub_key_y = to_hex(coords->second.bytes);
    }

    const auto input = encoding::decode_input(hex);
    if (!input.has_value())
    {
        print_outcome(out, Reason::malformed_input);
        return EXIT_INVALID;
    }

    if (opts.prover_toml)
        out << encoding::to_prover_inputs(*input);

    if (opts.ecrecover)
        print_ecrecover(out, hex, *input);

    VerificationOutcome outcome;
    if (opts.cross_check)
    {
        const auto report = cross_check(*input);
        if (!report.consistent())
        {
            err << "cross-check divergence: " << report.divergence() << '\n';
            return EXIT_DIVERGENCE;
        }
        outcome = report.native;
    }
    else
    {
        outcome = verify(*input, opts.mode);
    }

    print_outcome(out, outcome);
    return is_valid(outcome) ? EXIT_OK : EXIT_INVALID;
}
}  // namespace

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err)
{
    try
    {
        const auto opts = parse_args(args);
        if (opts.help)
        {
            out << USAGE;
            return EXIT_OK;
        }

        const auto cases =
            opts.input_file.empty() ? std::vector<Case>{opts.single} : load_cases(opts.input_file);

        int exit_code = EXIT_OK;
        for (const auto& c : cases)
        {
            const auto code = run_case(c, opts, out, err);
            if (code == EXIT_DIVERGENCE)
                return code;  // The contexts disagree: nothing else can be trusted.
            if (code != EXIT_OK)
                exit_code = code;
        }
        return exit_code;
    }
    catch (const std::invalid_argument& e)
    {
        err << "error: " << e.what() << "\n\n" << USAGE;
        return EXIT_USAGE;
    }
    catch (const nlohmann::json::exception& e)
    {
        err << "invalid input file: " << e.what() << '\n';
        return EXIT_USAGE;
    }
    catch (const std::exception& e)
    {
        err << "error: " << e.what() << '\n';
        return EXIT_USAGE;
    }
}
}  // namespace ecproof::verify_tool
