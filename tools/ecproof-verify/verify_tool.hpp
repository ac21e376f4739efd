// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace ecproof::verify_tool
{
constexpr int EXIT_OK = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_DIVERGENCE = 3;

/// Runs the ecproof-verify command with the arguments following the program name.
///
/// Results go to out, diagnostics and the usage text to err.
/// Returns the process exit code.
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
}  // namespace ecproof::verify_tool
