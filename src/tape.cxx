/*
    TapeVM - A debuggable brainfuck VM
    Tape implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "tapevm/tape.hxx"

#include <cstring>
#include <type_traits>

#include "simde/x86/avx2.h"

namespace tapevm {

namespace {

template <typename CellT>
inline void simdClear(CellT* start, std::size_t count) {
    std::uint8_t* bytes = reinterpret_cast<std::uint8_t*>(start);
    std::size_t byteCount = count * sizeof(CellT);
    const simde__m256i zero = simde_mm256_setzero_si256();
    std::size_t simdBytes = byteCount & ~static_cast<std::size_t>(31);
    for (std::size_t i = 0; i < simdBytes; i += 32) {
        simde_mm256_storeu_si256(reinterpret_cast<simde__m256i*>(bytes + i), zero);
    }
    std::memset(bytes + simdBytes, 0, byteCount - simdBytes);
}

Tape::Storage makeStorage(std::size_t size, unsigned widthBits) {
    switch (widthBits) {
        case 8:
            return std::vector<std::uint8_t>(size, 0);
        case 16:
            return std::vector<std::uint16_t>(size, 0);
        case 32:
            return std::vector<std::uint32_t>(size, 0);
        default:
            throw ConfigError("Unsupported cell width " + std::to_string(widthBits) +
                              "; use 8, 16 or 32");
    }
}

}  // namespace

Tape::Tape(std::size_t size, unsigned widthBits)
    : cells_(makeStorage(size, widthBits)), size_(size), width_(widthBits) {}

std::uint32_t Tape::read(std::size_t index) const {
    return std::visit([index](const auto& cells) -> std::uint32_t { return cells[index]; }, cells_);
}

void Tape::write(std::size_t index, std::uint64_t value) {
    std::visit(
        [index, value](auto& cells) {
            using CellT = typename std::decay_t<decltype(cells)>::value_type;
            cells[index] = static_cast<CellT>(value);
        },
        cells_);
}

void Tape::advance(std::ptrdiff_t delta) {
    if (!size_) return;
    const auto n = static_cast<std::ptrdiff_t>(size_);
    std::ptrdiff_t next = (static_cast<std::ptrdiff_t>(pointer_) + delta % n + n) % n;
    pointer_ = static_cast<std::size_t>(next);
}

void Tape::resize(std::size_t size, unsigned widthBits) {
    if (size == size_ && widthBits == width_) {
        clear();
        return;
    }
    cells_ = makeStorage(size, widthBits);
    size_ = size;
    width_ = widthBits;
    pointer_ = 0;
}

void Tape::clear() {
    std::visit([](auto& cells) { simdClear(cells.data(), cells.size()); }, cells_);
    pointer_ = 0;
}

std::optional<std::size_t> Tape::lastNonZero() const {
    return std::visit(
        [](const auto& cells) -> std::optional<std::size_t> {
            for (std::size_t i = cells.size(); i-- > 0;) {
                if (cells[i]) return i;
            }
            return std::nullopt;
        },
        cells_);
}

}  // namespace tapevm
