/*
    TapeVM - A debuggable brainfuck VM
    Source map interface and lookup table
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tapevm.hxx"

namespace tapevm {

using MacroParameters = std::map<std::string, std::string>;

// Half-open range: end.column is exclusive on end.line.
struct SourceRange {
    Position start;
    Position end;

    bool contains(std::size_t line, std::size_t column) const;
};

struct MacroCall {
    std::string macroName;
    SourceRange callSite;
    MacroParameters parameters;
};

struct MapEntry {
    SourceRange expandedRange;
    SourceRange sourceRange;
    std::string macroName;
    unsigned expansionDepth = 0;
    MacroParameters parameterValues;
    // Outermost call first.
    std::vector<MacroCall> macroCallStack;
};

struct MacroFrame {
    std::string macroName;
    MacroParameters parameters;

    friend bool operator==(const MacroFrame&, const MacroFrame&) = default;
};

/// @brief Mapping between expanded (executable) code and the pre-expansion source.
///
/// Supplied by the macro preprocessor. Coordinates are 1-based on both sides.
class SourceMap {
   public:
    virtual ~SourceMap() = default;

    virtual std::vector<MapEntry> getExpandedPositions(std::size_t sourceLine,
                                                       std::size_t sourceColumn) const = 0;
    virtual std::vector<MapEntry> entriesOnSourceLine(std::size_t sourceLine) const = 0;
    virtual std::optional<MapEntry> getSourcePosition(std::size_t expandedLine,
                                                      std::size_t expandedColumn) const = 0;
    /// Macro invocations enclosing an expanded position, outermost first.
    virtual std::vector<MacroFrame> getMacroContext(std::size_t expandedLine,
                                                    std::size_t expandedColumn) const = 0;
};

class SourceMapTable final : public SourceMap {
   public:
    void addMapping(MapEntry entry);

    std::vector<MapEntry> getExpandedPositions(std::size_t sourceLine,
                                               std::size_t sourceColumn) const override;
    std::vector<MapEntry> entriesOnSourceLine(std::size_t sourceLine) const override;
    std::optional<MapEntry> getSourcePosition(std::size_t expandedLine,
                                              std::size_t expandedColumn) const override;
    std::vector<MacroFrame> getMacroContext(std::size_t expandedLine,
                                            std::size_t expandedColumn) const override;

    const std::vector<MapEntry>& entries() const { return entries_; }

    static SourceMapTable fromYaml(const std::string& document);
    static SourceMapTable loadFile(const std::string& path);

   private:
    std::vector<MapEntry> entries_;
    std::unordered_map<Position, std::vector<std::size_t>, PositionHash> expandedStart_;
    std::unordered_map<std::size_t, std::vector<std::size_t>> expandedLine_;
    std::unordered_map<Position, std::vector<std::size_t>, PositionHash> sourceStart_;
    std::unordered_map<std::size_t, std::vector<std::size_t>> sourceLine_;
};

}  // namespace tapevm
