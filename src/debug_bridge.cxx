/*
    TapeVM - A debuggable brainfuck VM
    Breakpoints and source-level debugging
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "tapevm/debug_bridge.hxx"

#include <algorithm>
#include <iostream>
#include <utility>

namespace tapevm {

namespace {

std::size_t toZeroBased(std::size_t v) { return v ? v - 1 : 0; }

// Extent of the expanded code an entry covers, compared lines first.
std::pair<long long, long long> span(const MapEntry& e) {
    const auto& r = e.expandedRange;
    return {static_cast<long long>(r.end.line) - static_cast<long long>(r.start.line),
            static_cast<long long>(r.end.column) - static_cast<long long>(r.start.column)};
}

}  // namespace

void DebugBridge::rebuild() {
    breakpoints_ = direct_;
    for (const auto& [source, targets] : sourceBreakpoints_) {
        breakpoints_.insert(targets.begin(), targets.end());
    }
    ++version_;
}

bool DebugBridge::toggleBreakpoint(const Position& p) {
    if (!direct_.erase(p)) direct_.insert(p);
    rebuild();
    return hasBreakpointAt(p);
}

std::optional<Position> DebugBridge::resolveSource(const Position& source) const {
    if (!sourceMap_) return source;
    const std::size_t line = source.line + 1;
    auto candidates = sourceMap_->getExpandedPositions(line, source.column);
    if (candidates.empty()) candidates = sourceMap_->getExpandedPositions(line, source.column + 1);
    if (candidates.empty()) candidates = sourceMap_->entriesOnSourceLine(line);
    if (candidates.empty()) return std::nullopt;

    // The widest expansion is the full macro expansion; the first one wins a tie.
    const MapEntry* best = &candidates.front();
    for (const auto& c : candidates) {
        if (span(c) > span(*best)) best = &c;
    }
    return Position{toZeroBased(best->expandedRange.start.line),
                    toZeroBased(best->expandedRange.start.column)};
}

SourceToggle DebugBridge::toggleSourceBreakpoint(const Position& source) {
    if (auto it = sourceBreakpoints_.find(source); it != sourceBreakpoints_.end()) {
        sourceBreakpoints_.erase(it);
        rebuild();
        return SourceToggle::Removed;
    }
    auto target = resolveSource(source);
    if (!target) {
        std::cerr << "warning: no executable code for source line " << source.line << std::endl;
        return SourceToggle::NoCode;
    }
    sourceBreakpoints_.emplace(source, std::vector<Position>{*target});
    rebuild();
    return SourceToggle::Added;
}

void DebugBridge::clearAll() {
    direct_.clear();
    breakpoints_.clear();
    sourceBreakpoints_.clear();
    ++version_;
}

void DebugBridge::assign(BreakpointSet direct, SourceBreakpointMap sourceBreakpoints) {
    direct_ = std::move(direct);
    sourceBreakpoints_ = std::move(sourceBreakpoints);
    rebuild();
}

void DebugBridge::setSourceMap(std::shared_ptr<const SourceMap> map) {
    sourceMap_ = std::move(map);
    clearTracking();
}

void DebugBridge::clearTracking() {
    currentSource_.reset();
    macroContext_.clear();
}

void DebugBridge::track(const Position& expanded) {
    if (!sourceMap_) return;
    auto entry = sourceMap_->getSourcePosition(expanded.line + 1, expanded.column + 1);
    if (!entry) {
        clearTracking();
        return;
    }
    currentSource_ = Position{toZeroBased(entry->sourceRange.start.line),
                              toZeroBased(entry->sourceRange.start.column)};
    macroContext_.clear();
    auto frames = sourceMap_->getMacroContext(expanded.line + 1, expanded.column + 1);
    for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
        if (!it->macroName.empty()) macroContext_.push_back(std::move(*it));
    }
}

}  // namespace tapevm
