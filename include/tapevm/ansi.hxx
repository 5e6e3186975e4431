/*
    TapeVM - A debuggable brainfuck VM
    Terminal escape sequences for diagnostics and dumps
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include <string_view>

namespace tapevm::ansi {
// Diagnostic prefixes.
inline constexpr std::string_view error{"\x1b[1;31m"};
inline constexpr std::string_view warning{"\x1b[1;33m"};
inline constexpr std::string_view notice{"\x1b[33m"};
// Memory dump header row and the cell under the pointer.
inline constexpr std::string_view header{"\x1b[4m"};
inline constexpr std::string_view pointer{"\x1b[1;32m"};
inline constexpr std::string_view reset{"\x1b[0m"};
}  // namespace tapevm::ansi
