/*
    TapeVM - A debuggable brainfuck VM
    Program index implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "tapevm/program.hxx"

#include <algorithm>
#include <iostream>

namespace tapevm {

std::size_t CompiledProgram::indexAtOrAfter(const Position& p) const {
    auto it = std::lower_bound(ops.begin(), ops.end(), p,
                               [](const Operation& op, const Position& pos) {
                                   return op.position < pos;
                               });
    return static_cast<std::size_t>(it - ops.begin());
}

const std::vector<BracketError>& ProgramIndex::rebuild(std::vector<std::string> lines) {
    lines_ = std::move(lines);
    loopMap_.clear();
    errors_.clear();
    compiled_.reset();

    std::vector<Position> stack;
    for (std::size_t line = 0; line < lines_.size(); ++line) {
        const std::string& text = lines_[line];
        for (std::size_t column = 0; column < text.size(); ++column) {
            const char ch = text[column];
            if (ch == kLineTerminator) break;
            if (ch == '[') {
                stack.push_back({line, column});
            } else if (ch == ']') {
                if (stack.empty()) {
                    std::cerr << "warning: unmatched ']' at line " << line << ", column "
                              << column << std::endl;
                    errors_.push_back({BracketError::Kind::UnmatchedClose, {line, column}});
                    continue;
                }
                const Position open = stack.back();
                stack.pop_back();
                loopMap_[open] = {line, column};
                loopMap_[{line, column}] = open;
            }
        }
    }
    if (!stack.empty()) {
        std::cerr << "warning: " << stack.size() << " unmatched '[' (first at line "
                  << stack.front().line << ", column " << stack.front().column << ")"
                  << std::endl;
        for (const auto& p : stack) errors_.push_back({BracketError::Kind::UnmatchedOpen, p});
    }
    return errors_;
}

std::optional<Position> ProgramIndex::matchOf(const Position& p) const {
    auto it = loopMap_.find(p);
    if (it == loopMap_.end()) return std::nullopt;
    return it->second;
}

std::optional<char> ProgramIndex::charAt(const Position& p) const {
    if (p.line >= lines_.size()) return std::nullopt;
    const std::string& text = lines_[p.line];
    if (p.column >= text.size()) return std::nullopt;
    return text[p.column];
}

bool ProgramIndex::next(Position& p) const {
    if (p.line >= lines_.size()) return false;
    if (p.column + 1 < lines_[p.line].size()) {
        ++p.column;
        return true;
    }
    return nextLine(p);
}

bool ProgramIndex::nextLine(Position& p) const {
    if (p.line + 1 < lines_.size()) {
        ++p.line;
        p.column = 0;
        return true;
    }
    return false;
}

const CompiledProgram& ProgramIndex::flatten() const {
    if (compiled_) return *compiled_;
    auto compiled = std::make_shared<CompiledProgram>();
    auto& ops = compiled->ops;
    auto& jumps = compiled->jumps;
    std::vector<std::size_t> stack;
    for (std::size_t line = 0; line < lines_.size(); ++line) {
        const std::string& text = lines_[line];
        for (std::size_t column = 0; column < text.size(); ++column) {
            const char ch = text[column];
            if (ch == kLineTerminator) break;
            if (!isInstruction(ch) && ch != kBreakpointMarker) continue;
            const std::size_t index = ops.size();
            ops.push_back({ch, {line, column}});
            jumps.push_back(CompiledProgram::npos);
            if (ch == '[') {
                stack.push_back(index);
            } else if (ch == ']' && !stack.empty()) {
                const std::size_t open = stack.back();
                stack.pop_back();
                jumps[open] = index;
                jumps[index] = open;
            }
        }
    }
    compiled_ = std::move(compiled);
    return *compiled_;
}

}  // namespace tapevm
