/*
    TapeVM - A debuggable brainfuck VM
    Tape snapshots
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "tapevm/snapshot.hxx"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace tapevm {

namespace {

std::string megabytes(std::size_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / (1024.0 * 1024.0)
        << "MB";
    return out.str();
}

void emitLabels(YAML::Emitter& out, const char* key,
                const std::map<std::size_t, std::string>& labels) {
    out << YAML::Key << key << YAML::Value << YAML::BeginMap;
    for (const auto& [index, label] : labels) out << YAML::Key << index << YAML::Value << label;
    out << YAML::EndMap;
}

std::map<std::size_t, std::string> readLabels(const YAML::Node& node) {
    std::map<std::size_t, std::string> labels;
    if (!node) return labels;
    for (auto it = node.begin(); it != node.end(); ++it) {
        labels[it->first.as<std::size_t>()] = it->second.as<std::string>();
    }
    return labels;
}

Snapshot fromNode(const YAML::Node& root) {
    if (!root.IsMap()) throw FormatError("snapshot document must be a mapping");
    Snapshot snapshot;
    snapshot.name = root["name"].as<std::string>("");
    snapshot.timestamp = root["timestamp"].as<std::int64_t>(0);
    snapshot.pointer = root["pointer"].as<std::size_t>(0);
    snapshot.cellWidth = root["cellWidth"].as<unsigned>(TAPEVM_DEFAULT_CELL_WIDTH);
    snapshot.tapeSize = root["tapeSize"].as<std::size_t>(TAPEVM_DEFAULT_TAPE_SIZE);
    if (const YAML::Node tape = root["tape"]) snapshot.tape = tape.as<std::vector<std::uint32_t>>();
    if (const YAML::Node labels = root["labels"]) {
        snapshot.labels.lanes = readLabels(labels["lanes"]);
        snapshot.labels.columns = readLabels(labels["columns"]);
        snapshot.labels.cells = readLabels(labels["cells"]);
    }

    try {
        validateCellWidth(snapshot.cellWidth);
        validateTapeSize(snapshot.tapeSize, snapshot.cellWidth);
    } catch (const ConfigError& e) {
        throw FormatError(std::string("invalid snapshot geometry: ") + e.what());
    }
    if (snapshot.tape.size() > snapshot.tapeSize) {
        throw FormatError("snapshot stores " + std::to_string(snapshot.tape.size()) +
                          " cells for a tape of " + std::to_string(snapshot.tapeSize));
    }
    return snapshot;
}

}  // namespace

SnapshotTooLarge::SnapshotTooLarge(std::size_t bytes, std::size_t limit)
    : std::runtime_error("Snapshot is too large (" + megabytes(bytes) + ", limit " +
                         megabytes(limit) + ")"),
      bytes_(bytes),
      limit_(limit) {}

Snapshot takeSnapshot(const Tape& tape, std::string name, TapeLabels labels) {
    Snapshot snapshot;
    snapshot.name = std::move(name);
    snapshot.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
    snapshot.pointer = tape.pointer();
    snapshot.cellWidth = tape.cellWidth();
    snapshot.tapeSize = tape.size();
    snapshot.labels = std::move(labels);

    const std::size_t used = std::max(tape.lastNonZero().value_or(0), tape.pointer()) + 1;
    snapshot.tape.reserve(used);
    for (std::size_t i = 0; i < used && i < tape.size(); ++i) snapshot.tape.push_back(tape.read(i));
    return snapshot;
}

std::string serialize(const Snapshot& snapshot, std::size_t limit) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << snapshot.name;
    out << YAML::Key << "timestamp" << YAML::Value << snapshot.timestamp;
    out << YAML::Key << "pointer" << YAML::Value << snapshot.pointer;
    out << YAML::Key << "cellWidth" << YAML::Value << snapshot.cellWidth;
    out << YAML::Key << "tapeSize" << YAML::Value << snapshot.tapeSize;
    out << YAML::Key << "tape" << YAML::Value << YAML::Flow << snapshot.tape;
    out << YAML::Key << "labels" << YAML::Value << YAML::BeginMap;
    emitLabels(out, "lanes", snapshot.labels.lanes);
    emitLabels(out, "columns", snapshot.labels.columns);
    emitLabels(out, "cells", snapshot.labels.cells);
    out << YAML::EndMap;
    out << YAML::EndMap;
    if (!out.good()) throw FormatError("snapshot could not be encoded: " + out.GetLastError());

    const std::size_t bytes = out.size();
    if (bytes > limit) throw SnapshotTooLarge(bytes, limit);
    return out.c_str();
}

Snapshot parseSnapshot(const std::string& document) {
    try {
        return fromNode(YAML::Load(document));
    } catch (const YAML::Exception& ex) {
        throw FormatError(std::string("malformed snapshot: ") + ex.what());
    }
}

void saveSnapshot(const Snapshot& snapshot, const std::string& path, std::size_t limit) {
    const std::string document = serialize(snapshot, limit);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) throw FormatError("Snapshot could not be written: " + path);
    file << document << '\n';
    if (!file) throw FormatError("Snapshot could not be written: " + path);
}

Snapshot loadSnapshotFile(const std::string& path) {
    try {
        return fromNode(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        throw FormatError("Snapshot could not be opened: " + path);
    } catch (const YAML::Exception& ex) {
        throw FormatError("malformed snapshot " + path + ": " + ex.what());
    }
}

void restoreSnapshot(Engine& engine, const Snapshot& snapshot) {
    engine.loadSnapshot(snapshot.tape, snapshot.pointer, snapshot.cellWidth, snapshot.tapeSize);
}

}  // namespace tapevm
