/*
    TapeVM - A debuggable brainfuck VM
    Configuration validation and shared helpers
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <string>

#include "tapevm.hxx"

namespace tapevm {

std::string toString(const Position& p) {
    return std::to_string(p.line) + ":" + std::to_string(p.column);
}

void validateCellWidth(unsigned bits) {
    if (bits != 8 && bits != 16 && bits != 32) {
        throw ConfigError("Unsupported cell width " + std::to_string(bits) + "; use 8, 16 or 32");
    }
}

void validateTapeSize(std::size_t size, unsigned cellWidth) {
    if (size == 0) throw ConfigError("Tape size must be a positive integer");
    const std::size_t widthBytes = cellWidth / 8;
    if (widthBytes == 0 || size > (TAPEVM_TAPE_MAX_BYTES / widthBytes)) {
        throw ConfigError("Requested tape exceeds maximum allowed size (" +
                          std::to_string(TAPEVM_TAPE_MAX_BYTES >> 20) + " MiB)");
    }
}

void validateLaneCount(unsigned count) {
    if (count < 1 || count > TAPEVM_MAX_LANE_COUNT) {
        throw ConfigError("Lane count must be between 1 and " +
                          std::to_string(TAPEVM_MAX_LANE_COUNT));
    }
}

void validate(const EngineConfig& cfg) {
    validateCellWidth(cfg.cellWidth);
    validateTapeSize(cfg.tapeSize, cfg.cellWidth);
    validateLaneCount(cfg.laneCount);
    if (cfg.increment == 0) throw ConfigError("Increment must be positive");
    if (cfg.turboBatch == 0 || cfg.immediateBatch == 0) {
        throw ConfigError("Batch sizes must be positive");
    }
}

void appendCodePoint(std::string& out, std::uint32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}  // namespace tapevm
