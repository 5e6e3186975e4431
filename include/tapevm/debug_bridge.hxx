/*
    TapeVM - A debuggable brainfuck VM
    Breakpoints and source-level debugging
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "tapevm.hxx"
#include "tapevm/source_map.hxx"

namespace tapevm {

enum class SourceToggle : std::uint8_t { Added, Removed, NoCode };

using BreakpointSet = std::set<Position>;
// Source breakpoint -> expanded positions it resolved to.
using SourceBreakpointMap = std::map<Position, std::vector<Position>>;

/// @brief Breakpoint sets and source position tracking through an optional source map.
///
/// Engine positions are 0-based. The source map is queried with 1-based coordinates.
/// An expanded position stays a breakpoint while it is set directly or claimed by any source
/// breakpoint.
class DebugBridge {
   public:
    /// Toggles the directly set breakpoint at p. Returns true when p is still a breakpoint.
    bool toggleBreakpoint(const Position& p);
    SourceToggle toggleSourceBreakpoint(const Position& source);
    bool hasBreakpointAt(const Position& p) const { return breakpoints_.count(p) != 0; }
    bool hasSourceBreakpointAt(const Position& p) const { return sourceBreakpoints_.count(p) != 0; }
    void clearAll();

    /// Expanded position a source breakpoint at `source` resolves to, if any code maps there.
    std::optional<Position> resolveSource(const Position& source) const;

    void setSourceMap(std::shared_ptr<const SourceMap> map);
    const std::shared_ptr<const SourceMap>& sourceMap() const { return sourceMap_; }

    /// Recomputes the source position and macro context for an expanded position.
    void track(const Position& expanded);
    void clearTracking();
    const std::optional<Position>& currentSourcePosition() const { return currentSource_; }
    // Innermost macro first.
    const std::vector<MacroFrame>& macroContext() const { return macroContext_; }

    // Effective set: direct breakpoints plus every source breakpoint target.
    const BreakpointSet& breakpoints() const { return breakpoints_; }
    const BreakpointSet& directBreakpoints() const { return direct_; }
    const SourceBreakpointMap& sourceBreakpoints() const { return sourceBreakpoints_; }
    void assign(BreakpointSet direct, SourceBreakpointMap sourceBreakpoints);
    bool empty() const { return breakpoints_.empty(); }

    /// Bumped on every breakpoint change.
    std::uint64_t version() const { return version_; }

   private:
    void rebuild();

    BreakpointSet direct_;
    BreakpointSet breakpoints_;
    SourceBreakpointMap sourceBreakpoints_;
    std::shared_ptr<const SourceMap> sourceMap_;
    std::optional<Position> currentSource_;
    std::vector<MacroFrame> macroContext_;
    std::uint64_t version_ = 0;
};

}  // namespace tapevm
