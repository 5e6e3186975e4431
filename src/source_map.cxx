/*
    TapeVM - A debuggable brainfuck VM
    Source map lookup table
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "tapevm/source_map.hxx"

#include <yaml-cpp/yaml.h>

#include <limits>

namespace tapevm {

bool SourceRange::contains(std::size_t line, std::size_t column) const {
    if (line < start.line || line > end.line) return false;
    if (line == start.line && column < start.column) return false;
    if (line == end.line && column >= end.column) return false;
    return true;
}

void SourceMapTable::addMapping(MapEntry entry) {
    const std::size_t index = entries_.size();
    expandedStart_[entry.expandedRange.start].push_back(index);
    expandedLine_[entry.expandedRange.start.line].push_back(index);
    sourceStart_[entry.sourceRange.start].push_back(index);
    sourceLine_[entry.sourceRange.start.line].push_back(index);
    entries_.push_back(std::move(entry));
}

std::vector<MapEntry> SourceMapTable::getExpandedPositions(std::size_t sourceLine,
                                                           std::size_t sourceColumn) const {
    std::vector<MapEntry> result;
    if (auto it = sourceStart_.find({sourceLine, sourceColumn}); it != sourceStart_.end()) {
        for (auto i : it->second) result.push_back(entries_[i]);
        return result;
    }
    if (auto it = sourceLine_.find(sourceLine); it != sourceLine_.end()) {
        for (auto i : it->second) {
            if (entries_[i].sourceRange.contains(sourceLine, sourceColumn)) {
                result.push_back(entries_[i]);
            }
        }
    }
    return result;
}

std::vector<MapEntry> SourceMapTable::entriesOnSourceLine(std::size_t sourceLine) const {
    std::vector<MapEntry> result;
    if (auto it = sourceLine_.find(sourceLine); it != sourceLine_.end()) {
        for (auto i : it->second) result.push_back(entries_[i]);
    }
    return result;
}

std::optional<MapEntry> SourceMapTable::getSourcePosition(std::size_t expandedLine,
                                                          std::size_t expandedColumn) const {
    // Innermost (deepest) expansion wins; the first candidate is kept on ties.
    auto deepest = [this](const std::vector<std::size_t>& candidates) -> std::optional<MapEntry> {
        if (candidates.empty()) return std::nullopt;
        std::size_t best = candidates.front();
        for (auto i : candidates) {
            if (entries_[i].expansionDepth > entries_[best].expansionDepth) best = i;
        }
        return entries_[best];
    };

    if (auto it = expandedStart_.find({expandedLine, expandedColumn});
        it != expandedStart_.end() && !it->second.empty()) {
        return deepest(it->second);
    }

    if (auto it = expandedLine_.find(expandedLine); it != expandedLine_.end()) {
        std::vector<std::size_t> containing;
        for (auto i : it->second) {
            if (entries_[i].expandedRange.contains(expandedLine, expandedColumn)) {
                containing.push_back(i);
            }
        }
        if (!containing.empty()) return deepest(containing);
    }

    // Ranges that start on an earlier line.
    std::optional<std::size_t> best;
    long long bestDistance = std::numeric_limits<long long>::max();
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const auto& range = entries_[i].expandedRange;
        if (!range.contains(expandedLine, expandedColumn)) continue;
        const long long distance =
            static_cast<long long>(expandedLine - range.start.line) * 1000 +
            (static_cast<long long>(expandedColumn) - static_cast<long long>(range.start.column));
        if (distance < bestDistance) {
            bestDistance = distance;
            best = i;
        }
    }
    if (best) return entries_[*best];
    return std::nullopt;
}

std::vector<MacroFrame> SourceMapTable::getMacroContext(std::size_t expandedLine,
                                                        std::size_t expandedColumn) const {
    std::vector<MacroFrame> frames;
    auto entry = getSourcePosition(expandedLine, expandedColumn);
    if (!entry) return frames;
    if (!entry->macroCallStack.empty()) {
        for (const auto& call : entry->macroCallStack) {
            frames.push_back({call.macroName, call.parameters});
        }
    } else if (!entry->macroName.empty()) {
        frames.push_back({entry->macroName, entry->parameterValues});
    }
    return frames;
}

namespace {

SourceRange readRange(const YAML::Node& node) {
    if (!node.IsSequence() || node.size() != 4) {
        throw FormatError("source map range must be [startLine, startColumn, endLine, endColumn]");
    }
    return {{node[0].as<std::size_t>(), node[1].as<std::size_t>()},
            {node[2].as<std::size_t>(), node[3].as<std::size_t>()}};
}

MacroParameters readParameters(const YAML::Node& node) {
    MacroParameters params;
    if (!node) return params;
    for (auto it = node.begin(); it != node.end(); ++it) {
        params[it->first.as<std::string>()] = it->second.as<std::string>();
    }
    return params;
}

SourceMapTable fromNode(const YAML::Node& root) {
    SourceMapTable table;
    const YAML::Node entries = root["entries"];
    if (!entries || !entries.IsSequence()) throw FormatError("source map has no 'entries' list");
    for (const auto& e : entries) {
        MapEntry entry;
        entry.expandedRange = readRange(e["expanded"]);
        entry.sourceRange = readRange(e["source"]);
        if (e["macro"]) entry.macroName = e["macro"].as<std::string>();
        if (e["depth"]) entry.expansionDepth = e["depth"].as<unsigned>();
        entry.parameterValues = readParameters(e["parameters"]);
        if (const YAML::Node stack = e["callStack"]) {
            for (const auto& call : stack) {
                MacroCall c;
                c.macroName = call["macro"].as<std::string>("");
                if (call["callSite"]) c.callSite = readRange(call["callSite"]);
                c.parameters = readParameters(call["parameters"]);
                entry.macroCallStack.push_back(std::move(c));
            }
        }
        table.addMapping(std::move(entry));
    }
    return table;
}

}  // namespace

SourceMapTable SourceMapTable::fromYaml(const std::string& document) {
    try {
        return fromNode(YAML::Load(document));
    } catch (const YAML::Exception& ex) {
        throw FormatError(std::string("malformed source map: ") + ex.what());
    }
}

SourceMapTable SourceMapTable::loadFile(const std::string& path) {
    try {
        return fromNode(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        throw FormatError("Source map could not be opened: " + path);
    } catch (const YAML::Exception& ex) {
        throw FormatError("malformed source map " + path + ": " + ex.what());
    }
}

}  // namespace tapevm
