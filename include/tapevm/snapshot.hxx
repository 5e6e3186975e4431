/*
    TapeVM - A debuggable brainfuck VM
    Tape snapshots
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "tapevm.hxx"
#include "tapevm/engine.hxx"
#include "tapevm/tape.hxx"

namespace tapevm {

struct TapeLabels {
    std::map<std::size_t, std::string> lanes;
    std::map<std::size_t, std::string> columns;
    std::map<std::size_t, std::string> cells;

    bool empty() const { return lanes.empty() && columns.empty() && cells.empty(); }
};

/// Used prefix of a tape plus its geometry. Restorable onto any engine.
struct Snapshot {
    std::string name;
    std::int64_t timestamp = 0;  // ms since epoch
    std::vector<std::uint32_t> tape;
    std::size_t pointer = 0;
    unsigned cellWidth = TAPEVM_DEFAULT_CELL_WIDTH;
    std::size_t tapeSize = TAPEVM_DEFAULT_TAPE_SIZE;
    TapeLabels labels;
};

class SnapshotTooLarge : public std::runtime_error {
   public:
    SnapshotTooLarge(std::size_t bytes, std::size_t limit);

    std::size_t bytes() const noexcept { return bytes_; }
    std::size_t limit() const noexcept { return limit_; }

   private:
    std::size_t bytes_;
    std::size_t limit_;
};

/// Captures cells up to the highest non-zero cell or the pointer, whichever is further.
Snapshot takeSnapshot(const Tape& tape, std::string name, TapeLabels labels = {});

/// YAML form of the snapshot. Throws SnapshotTooLarge above `limit` bytes.
std::string serialize(const Snapshot& snapshot, std::size_t limit = TAPEVM_SNAPSHOT_MAX_BYTES);
Snapshot parseSnapshot(const std::string& document);

void saveSnapshot(const Snapshot& snapshot, const std::string& path,
                  std::size_t limit = TAPEVM_SNAPSHOT_MAX_BYTES);
Snapshot loadSnapshotFile(const std::string& path);

void restoreSnapshot(Engine& engine, const Snapshot& snapshot);

}  // namespace tapevm
