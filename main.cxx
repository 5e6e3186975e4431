/*
    TapeVM - A debuggable brainfuck VM
    Command line runner
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "tapevm/ansi.hxx"
#include "tapevm.hxx"
#include "tapevm/dump.hxx"
#include "tapevm/facade.hxx"
#include "tapevm/scheduler.hxx"
#include "tapevm/snapshot.hxx"
#include "tapevm/source_map.hxx"
#ifdef TAPEVM_ENABLE_REPL
#include "cpp-terminal/color.hpp"
#include "repl.hxx"
#endif

#ifndef _WIN32
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace {
namespace ansi = tapevm::ansi;

#ifndef _WIN32
// Read-only mapping of a whole file; empty files map to nothing.
struct MappedFile {
    const char* data = nullptr;
    size_t size = 0;
    int fd = -1;

    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() { close(); }

    bool open(const std::string& path) {
        fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) return false;
        struct stat st{};
        if (fstat(fd, &st) != 0) return false;
        if (st.st_size == 0) return true;
        void* view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
        if (view == MAP_FAILED) return false;
        data = static_cast<const char*>(view);
        size = static_cast<size_t>(st.st_size);
        return true;
    }

    void close() {
        if (data && size) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
            munmap(const_cast<char*>(data), size);
        }
        if (fd >= 0) ::close(fd);
        data = nullptr;
        size = 0;
        fd = -1;
    }
};
#endif

// Splits on '\n' and drops a trailing '\r'. Columns stay as the editor shows them, so comments
// are kept.
std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

// Returns true on success; on error, 'err' is set and 'out' left unchanged.
bool readProgramFile(const std::string& filename, std::vector<std::string>& out,
                     std::string& err) {
#ifndef _WIN32
    {
        MappedFile mf;
        if (mf.open(filename)) {
            out = splitLines(std::string_view(mf.data ? mf.data : "", mf.size));
            return true;
        }
    }
#endif
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened: " + filename;
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!in.eof() && in.fail()) {
        err = "Error while reading file: " + filename;
        return false;
    }
    out = splitLines(text);
    return true;
}

struct CmdArgs {
    std::string filename;
    std::string evalCode;
    bool hasEval = false;
    bool dumpMemory = false;
    bool help = false;
    bool profile = false;
    bool turbo = false;
    bool worker = false;
    tapevm::EngineConfig config;
    std::vector<tapevm::Position> breakpoints;
    std::vector<tapevm::Position> sourceBreakpoints;
    std::string sourceMap;
    std::string loadPath;
    std::string savePath;
};

// Parses a 1-based "line:col" pair into an engine position.
bool parsePosition(std::string_view text, tapevm::Position& out) {
    const size_t colon = text.find(':');
    if (colon == std::string_view::npos) return false;
    const std::string line(text.substr(0, colon));
    const std::string col(text.substr(colon + 1));
    char* end = nullptr;
    const unsigned long long l = std::strtoull(line.c_str(), &end, 10);
    if (line.empty() || line[0] == '-' || *end != '\0' || l == 0) return false;
    const unsigned long long c = std::strtoull(col.c_str(), &end, 10);
    if (col.empty() || col[0] == '-' || *end != '\0' || c == 0) return false;
    out = {static_cast<size_t>(l - 1), static_cast<size_t>(c - 1)};
    return true;
}

bool parsePositive(const char* val, unsigned long long& out) {
    char* end = nullptr;
    out = std::strtoull(val, &end, 10);
    return val[0] != '-' && end != val && *end == '\0' && out > 0;
}

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        unsigned long long parsed = 0;
        if (arg == "-e" && i + 1 < argc) {
            args.evalCode = argv[++i];
            args.hasEval = true;
            args.filename.clear();
        } else if (arg == "-i" && i + 1 < argc && !args.hasEval) {
            args.filename = argv[++i];
        } else if (arg == "-dm") {
            args.dumpMemory = true;
        } else if (arg == "-h") {
            args.help = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "-turbo") {
            args.turbo = true;
        } else if (arg == "-worker") {
            args.worker = true;
        } else if (arg == "-ts" && i + 1 < argc) {
            const char* val = argv[++i];
            if (!parsePositive(val, parsed)) {
                std::cerr << "Tape size must be a positive integer: " << val << std::endl;
                args.help = true;
            } else {
                args.config.tapeSize = static_cast<size_t>(parsed);
            }
        } else if (arg == "-cw" && i + 1 < argc) {
            const char* val = argv[++i];
            if (!parsePositive(val, parsed)) {
                std::cerr << "Cell width must be a positive integer: " << val << std::endl;
                args.help = true;
            } else {
                args.config.cellWidth = static_cast<unsigned>(parsed);
            }
        } else if (arg == "-lanes" && i + 1 < argc) {
            const char* val = argv[++i];
            if (!parsePositive(val, parsed)) {
                std::cerr << "Lane count must be a positive integer: " << val << std::endl;
                args.help = true;
            } else {
                args.config.laneCount = static_cast<unsigned>(parsed);
            }
        } else if (arg == "-inc" && i + 1 < argc) {
            const char* val = argv[++i];
            if (!parsePositive(val, parsed) || parsed > UINT32_MAX) {
                std::cerr << "Increment must be a positive integer: " << val << std::endl;
                args.help = true;
            } else {
                args.config.increment = static_cast<std::uint32_t>(parsed);
            }
        } else if ((arg == "-b" || arg == "-sb") && i + 1 < argc) {
            const char* val = argv[++i];
            tapevm::Position p;
            if (!parsePosition(val, p)) {
                std::cerr << "Breakpoint must be LINE:COL (1-based): " << val << std::endl;
                args.help = true;
            } else if (arg == "-b") {
                args.breakpoints.push_back(p);
            } else {
                args.sourceBreakpoints.push_back(p);
            }
        } else if (arg == "-sm" && i + 1 < argc) {
            args.sourceMap = argv[++i];
        } else if (arg == "-load" && i + 1 < argc) {
            args.loadPath = argv[++i];
        } else if (arg == "-save" && i + 1 < argc) {
            args.savePath = argv[++i];
        }
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -e <code>        Execute Brainfuck code directly\n"
              << "  -i <file>        Execute code from file\n"
              << "  -ts <size>       Tape size in cells (default " << TAPEVM_DEFAULT_TAPE_SIZE
              << ")\n"
              << "  -cw <width>      Cell width in bits (8,16,32)\n"
              << "  -lanes <n>       Lanes used to group the memory dump (1-"
              << TAPEVM_MAX_LANE_COUNT << ")\n"
              << "  -inc <n>         Amount added by '+'\n"
              << "  -turbo           Run compiled in batches\n"
              << "  -worker          Run turbo on a worker thread\n"
              << "  -b <line:col>    Breakpoint in the program (repeatable)\n"
              << "  -sb <line:col>   Breakpoint in the macro source (repeatable, needs -sm)\n"
              << "  -sm <file>       Source map (YAML)\n"
              << "  -load <file>     Restore a tape snapshot before running\n"
              << "  -save <file>     Save a tape snapshot after running\n"
              << "  -dm              Dump memory after program\n"
              << "  --profile        Print execution profile\n"
              << "  -h               Show this help message" << std::endl;
}

void printError(std::string_view message) {
#ifdef TAPEVM_ENABLE_REPL
    std::cerr << Term::color_fg(Term::Color::Name::Red)
              << "ERROR:" << Term::color_fg(Term::Color::Name::Default) << ' ' << message
              << std::endl;
#else
    std::cerr << ansi::error << "ERROR:" << ansi::reset << ' ' << message << std::endl;
#endif
}

void printWarning(std::string_view message) {
#ifdef TAPEVM_ENABLE_REPL
    std::cerr << Term::color_fg(Term::Color::Name::Yellow)
              << "WARNING:" << Term::color_fg(Term::Color::Name::Default) << ' ' << message
              << std::endl;
#else
    std::cerr << ansi::warning << "WARNING:" << ansi::reset << ' ' << message << std::endl;
#endif
}

void prepare(tapevm::Engine& engine, const CmdArgs& opts) {
    if (!opts.sourceMap.empty()) {
        engine.setSourceMap(std::make_shared<tapevm::SourceMapTable>(
            tapevm::SourceMapTable::loadFile(opts.sourceMap)));
    }
    if (!opts.loadPath.empty()) {
        tapevm::restoreSnapshot(engine, tapevm::loadSnapshotFile(opts.loadPath));
    }
    for (const auto& p : opts.breakpoints) {
        if (!engine.hasBreakpointAt(p)) engine.toggleBreakpoint(p);
    }
    for (const auto& p : opts.sourceBreakpoints) {
        if (!engine.hasSourceBreakpointAt(p)) engine.toggleSourceBreakpoint(p);
    }
}

int runProgram(const CmdArgs& opts, std::vector<std::string> lines) {
    tapevm::EventLoop loop;
    tapevm::ExecutionFacade engine(loop, opts.config, opts.worker);
    engine.setProgram(std::move(lines));
    prepare(engine, opts);

    size_t printed = 0;
    bool inputPending = false;
    bool resumePending = false;
    const auto id = engine.subscribe([&](const tapevm::ExecutionState& s) {
        if (s.output.size() < printed) printed = 0;
        if (s.output.size() > printed) {
            std::cout << std::string_view(s.output).substr(printed) << std::flush;
            printed = s.output.size();
        }
        if (s.isStopped) {
            loop.quit();
            return;
        }
        if (!s.isRunning || !s.isPaused) return;
        if (s.isWaitingForInput) {
            if (inputPending) return;
            inputPending = true;
            loop.post([&] {
                inputPending = false;
                if (!engine.state().isWaitingForInput) return;
                const int c = std::cin.get();
                engine.provideInput(c == std::char_traits<char>::eof()
                                        ? 0
                                        : static_cast<std::uint32_t>(static_cast<unsigned char>(c)));
            });
            return;
        }
        if (resumePending) return;
        resumePending = true;
        loop.post([&] {
            resumePending = false;
            const tapevm::ExecutionState& state = engine.state();
            if (!state.isRunning || !state.isPaused || state.isWaitingForInput) return;
            std::cout << "\nBreakpoint hit\n";
            tapevm::printLocation(state);
            if (state.tape) tapevm::dumpMemory(*state.tape, state.laneCount);
            engine.resume();
        });
    });

    if (opts.turbo) {
        engine.runTurbo();
    } else {
        engine.runImmediately();
    }
    loop.run();
    engine.unsubscribe(id);

    const tapevm::ExecutionState& state = engine.state();
    if (state.output.size() > printed) {
        std::cout << std::string_view(state.output).substr(printed) << std::flush;
    }
    if (opts.dumpMemory && state.tape) tapevm::dumpMemory(*state.tape, state.laneCount);
    if (!opts.savePath.empty() && state.tape) {
        tapevm::saveSnapshot(tapevm::takeSnapshot(*state.tape, opts.savePath), opts.savePath);
    }
    if (opts.profile && state.lastRun) {
        std::cout << "Instructions executed: " << state.lastRun->operations << std::endl;
        std::cout << "Elapsed time: " << state.lastRun->seconds << "s" << std::endl;
    }
    return 0;
}
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs opts = parseArgs(argc, argv);
    if (opts.help) {
        printHelp(argv[0]);
        return 0;
    }
    try {
        tapevm::validate(opts.config);
        const size_t requiredMem = opts.config.tapeSize * (opts.config.cellWidth / 8);
        if (requiredMem > TAPEVM_TAPE_WARN_BYTES) {
            printWarning("Tape allocation ~" + std::to_string(requiredMem >> 20) +
                         " MiB may exceed system memory");
        }

        std::vector<std::string> lines;
        if (opts.hasEval) {
            lines = splitLines(opts.evalCode);
        } else if (!opts.filename.empty()) {
            std::string err;
            if (!readProgramFile(opts.filename, lines, err)) {
                printError(err);
                return 1;
            }
        } else {
#ifdef TAPEVM_ENABLE_REPL
            tapevm::EventLoop loop;
            tapevm::ExecutionFacade engine(loop, opts.config, opts.worker);
            prepare(engine, opts);
            return runRepl(engine, loop);
#else
            std::cout << "REPL disabled; use -i <file> or -e <code> to run a program" << std::endl;
            return 0;
#endif
        }
        return runProgram(opts, std::move(lines));
    } catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }
}
