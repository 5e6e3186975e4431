/*
    TapeVM - A debuggable brainfuck VM
    Core API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define TAPEVM_DEFAULT_TAPE_SIZE (1024u * 1024u)
#define TAPEVM_DEFAULT_CELL_WIDTH 8
#define TAPEVM_DEFAULT_LANE_COUNT 1
#define TAPEVM_MAX_LANE_COUNT 10
#define TAPEVM_DEFAULT_DELAY_MS 100
#define TAPEVM_FRAME_INTERVAL_MS 16
// Operations executed by one turbo batch before control returns to the scheduler.
#define TAPEVM_TURBO_BATCH 1000000
// Steps executed by one runImmediately batch before control returns to the scheduler.
#define TAPEVM_IMMEDIATE_BATCH 10000
#define TAPEVM_TAPE_WARN_BYTES (1ull << 30)  // 1 GiB
// Hard limit to prevent uncontrolled memory allocation from user inputs.
#define TAPEVM_TAPE_MAX_BYTES (1ull << 31)  // 2 GiB
#define TAPEVM_SNAPSHOT_MAX_BYTES (5ull << 20)  // 5 MiB

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tapevm {

inline constexpr char kBreakpointMarker = '$';
inline constexpr char kLineTerminator = '/';

// Characters with an effect on the tape or on control flow.
constexpr bool isInstruction(char c) {
    switch (c) {
        case '+':
        case '-':
        case '>':
        case '<':
        case '[':
        case ']':
        case '.':
        case ',':
            return true;
        default:
            return false;
    }
}

struct Position {
    std::size_t line = 0;
    std::size_t column = 0;

    friend bool operator==(const Position&, const Position&) = default;
    friend auto operator<=>(const Position&, const Position&) = default;
};

struct PositionHash {
    std::size_t operator()(const Position& p) const noexcept {
        return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(p.line) << 32) ^
                                          static_cast<std::uint64_t>(p.column));
    }
};

std::string toString(const Position& p);

// Rejected configuration request. The engine state is left untouched.
class ConfigError : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

// Unreadable or malformed snapshot / source map document.
class FormatError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

struct EngineConfig {
    std::size_t tapeSize = TAPEVM_DEFAULT_TAPE_SIZE;
    unsigned cellWidth = TAPEVM_DEFAULT_CELL_WIDTH;
    unsigned laneCount = TAPEVM_DEFAULT_LANE_COUNT;
    // Amount added by '+'. Read by both stepped and turbo execution.
    std::uint32_t increment = 1;
    std::size_t turboBatch = TAPEVM_TURBO_BATCH;
    std::size_t immediateBatch = TAPEVM_IMMEDIATE_BATCH;
};

void validateTapeSize(std::size_t size, unsigned cellWidth);
void validateCellWidth(unsigned bits);
void validateLaneCount(unsigned count);
void validate(const EngineConfig& cfg);

// Appends the UTF-8 encoding of a cell value to out.
void appendCodePoint(std::string& out, std::uint32_t value);

}  // namespace tapevm
