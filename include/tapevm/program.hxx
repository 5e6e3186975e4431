/*
    TapeVM - A debuggable brainfuck VM
    Program index declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tapevm.hxx"

namespace tapevm {

struct BracketError {
    enum class Kind : std::uint8_t { UnmatchedClose, UnmatchedOpen };
    Kind kind;
    Position position;
};

struct Operation {
    char opcode;
    Position position;
};

/// Flattened op list plus its jump table, indexed by op-list position.
struct CompiledProgram {
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    std::vector<Operation> ops;
    std::vector<std::size_t> jumps;

    std::size_t size() const { return ops.size(); }
    /// Index of the first operation at or after p, or size() when p is past the last one.
    std::size_t indexAtOrAfter(const Position& p) const;
};

/// @brief Line/column addressed view of the program text.
///
/// Built once per edit. Text following the line terminator marker on the same line is not part of
/// the program for stepping, bracket matching or flattening.
class ProgramIndex {
   public:
    ProgramIndex() = default;
    explicit ProgramIndex(std::vector<std::string> lines) { rebuild(std::move(lines)); }

    /// Rescans the program and rebuilds the loop map. Unmatched brackets are reported and
    /// returned; they never stop the scan.
    const std::vector<BracketError>& rebuild(std::vector<std::string> lines);

    std::optional<Position> matchOf(const Position& p) const;
    std::optional<char> charAt(const Position& p) const;

    /// Advances p to the next character. Returns false at the end of the program.
    bool next(Position& p) const;
    /// Advances p to the start of the next line. Returns false on the last line.
    bool nextLine(Position& p) const;

    /// Compiled op list, built on first use and cached until the next rebuild.
    const CompiledProgram& flatten() const;

    const std::vector<std::string>& lines() const { return lines_; }
    const std::vector<BracketError>& errors() const { return errors_; }
    bool empty() const { return lines_.empty(); }

   private:
    std::vector<std::string> lines_;
    std::unordered_map<Position, Position, PositionHash> loopMap_;
    std::vector<BracketError> errors_;
    mutable std::shared_ptr<const CompiledProgram> compiled_;
};

}  // namespace tapevm
