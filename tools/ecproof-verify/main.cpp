// ecproof: Zero-knowledge friendly proof of Ethereum address ownership
// Copyright 2026 The ecproof Authors.
// SPDX-License-Identifier: Apache-2.0

#include "verify_tool.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    return ecproof::verify_tool::run({argv + 1, argv + argc}, std::cout, std::cerr);
}
