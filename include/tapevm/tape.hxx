/*
    TapeVM - A debuggable brainfuck VM
    Tape declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "tapevm.hxx"

namespace tapevm {

/// @brief Fixed-capacity circular memory of 8, 16 or 32 bit unsigned cells plus the cell pointer.
///
/// All arithmetic is total: writes are reduced modulo 2^cellWidth and pointer movement wraps
/// around tapeSize. resize() and clear() zero-fill and reset the pointer, which invalidates any
/// span obtained through visit().
class Tape {
   public:
    using Storage =
        std::variant<std::vector<std::uint8_t>, std::vector<std::uint16_t>, std::vector<std::uint32_t>>;

    explicit Tape(std::size_t size = TAPEVM_DEFAULT_TAPE_SIZE,
                  unsigned widthBits = TAPEVM_DEFAULT_CELL_WIDTH);

    std::uint32_t read(std::size_t index) const;
    std::uint32_t read() const { return read(pointer_); }
    /// Stores value mod 2^cellWidth.
    void write(std::size_t index, std::uint64_t value);
    void write(std::uint64_t value) { write(pointer_, value); }

    /// Moves the pointer by delta cells, wrapping around the tape.
    void advance(std::ptrdiff_t delta);

    void resize(std::size_t size, unsigned widthBits);
    void clear();

    std::size_t pointer() const { return pointer_; }
    void setPointer(std::size_t p) { pointer_ = size_ ? p % size_ : 0; }
    std::size_t size() const { return size_; }
    unsigned cellWidth() const { return width_; }
    std::uint64_t modulus() const { return std::uint64_t{1} << width_; }
    std::uint64_t mask() const { return modulus() - 1; }
    std::size_t bytes() const { return size_ * (width_ / 8); }

    /// Highest index holding a non-zero value, or none for an all-zero tape.
    std::optional<std::size_t> lastNonZero() const;

    template <typename F>
    decltype(auto) visit(F&& f) {
        return std::visit(std::forward<F>(f), cells_);
    }
    template <typename F>
    decltype(auto) visit(F&& f) const {
        return std::visit(std::forward<F>(f), cells_);
    }

    friend bool operator==(const Tape& a, const Tape& b) {
        return a.pointer_ == b.pointer_ && a.cells_ == b.cells_;
    }

   private:
    Storage cells_;
    std::size_t size_ = 0;
    std::size_t pointer_ = 0;
    unsigned width_ = TAPEVM_DEFAULT_CELL_WIDTH;
};

}  // namespace tapevm
