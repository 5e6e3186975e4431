#pragma once

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "tapevm/engine.hxx"
#include "tapevm/scheduler.hxx"
#include "tapevm/tape.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

inline std::uint64_t hashTape(const tapevm::Tape& tape) {
    const std::uint64_t cells = tape.visit([](const auto& c) -> std::uint64_t {
        return XXH64(c.data(), c.size() * sizeof(c[0]), 0);
    });
    const std::size_t pointer = tape.pointer();
    return XXH64(&pointer, sizeof(pointer), cells);
}

// Redirects std::cerr for the lifetime of the object.
struct CerrCapture {
    std::ostringstream buffer;
    std::streambuf* old;

    CerrCapture() : old(std::cerr.rdbuf(buffer.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old); }
    CerrCapture(const CerrCapture&) = delete;
    CerrCapture& operator=(const CerrCapture&) = delete;

    bool contains(std::string_view text) const {
        return buffer.str().find(text) != std::string::npos;
    }
};

// Runs the loop until the engine stops, pauses or waits for input.
inline bool settle(tapevm::EventLoop& loop, const tapevm::Engine& engine,
                   std::size_t maxIterations = 10000000) {
    return loop.runUntil(
        [&] {
            const tapevm::ExecutionState& s = engine.state();
            return !s.isRunning || s.isPaused;
        },
        maxIterations);
}
