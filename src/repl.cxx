/*
    TapeVM - A debuggable brainfuck VM
    Line-based interactive debugger using linenoise-ng
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#ifdef TAPEVM_ENABLE_REPL
#include "repl.hxx"

#include <linenoise.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "tapevm/ansi.hxx"
#include "tapevm/dump.hxx"
#include "tapevm/snapshot.hxx"
#include "tapevm/source_map.hxx"

namespace {
namespace ansi = tapevm::ansi;

constexpr int historyLen = 100;
constexpr int quietPolls = 10;
constexpr std::chrono::milliseconds pollWait{100};

using tapevm::ExecutionFacade;
using tapevm::ExecutionState;

void printHelp() {
    std::cout << "Commands:\n"
              << ":load FILE         load a program file\n"
              << ":step [N]          execute N instructions (default 1)\n"
              << ":run [MS]          step every MS milliseconds\n"
              << ":smooth            step once per frame\n"
              << ":go                run in batches without delay\n"
              << ":turbo             run compiled from the start\n"
              << ":continue          resume after a pause\n"
              << ":pause             pause the current run\n"
              << ":stop              stop the current run\n"
              << ":reset             clear memory, output and position\n"
              << ":break L C         toggle a breakpoint (1-based)\n"
              << ":sbreak L C        toggle a breakpoint in the macro source\n"
              << ":clear             remove all breakpoints\n"
              << ":input CH          answer an input request\n"
              << ":dump              show memory\n"
              << ":where             show the current position\n"
              << ":size N            resize tape to N cells\n"
              << ":bits 8|16|32      switch cell width\n"
              << ":lanes N           group the dump into N lanes\n"
              << ":inc N             amount added by '+'\n"
              << ":autodump on|off   dump memory whenever execution pauses\n"
              << ":save FILE         write a tape snapshot\n"
              << ":restore FILE      load a tape snapshot\n"
              << ":sourcemap FILE    load a source map\n"
              << ":q                 quit\n"
              << "Any other line replaces the program." << std::endl;
}

void printError(std::string_view message) {
    std::cout << ansi::error << "ERROR:" << ansi::reset << ' ' << message << std::endl;
}

bool readPosition(std::istringstream& iss, tapevm::Position& out) {
    std::size_t line = 0;
    std::size_t col = 0;
    if (!(iss >> line >> col) || line == 0 || col == 0) return false;
    out = {line - 1, col - 1};
    return true;
}

class Session {
   public:
    Session(ExecutionFacade& engine, tapevm::EventLoop& loop, ReplConfig& cfg)
        : engine_(engine), loop_(loop), cfg_(cfg) {
        subscription_ = engine_.subscribe([this](const ExecutionState&) { ++updates_; });
    }
    ~Session() { engine_.unsubscribe(subscription_); }
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Returns false when the session should end.
    bool command(const std::string& input);
    void replaceProgram(std::vector<std::string> lines);

   private:
    bool finished() const {
        if (!engine_.state().isStopped) return false;
        std::cout << "Program finished; use :reset" << std::endl;
        return true;
    }
    template <typename Start>
    void start(Start&& begin) {
        if (finished()) return;
        const std::size_t before = updates_;
        begin();
        settle(before);
    }
    void settle(std::size_t before);
    void report();
    void flushOutput();

    ExecutionFacade& engine_;
    tapevm::EventLoop& loop_;
    ReplConfig& cfg_;
    tapevm::SubscriptionId subscription_ = 0;
    std::size_t updates_ = 0;
    std::size_t printed_ = 0;
};

// Drives the loop until the engine is paused or idle again. Gives up once nothing has been
// published for a while, which happens when the engine rejected the request.
void Session::settle(std::size_t before) {
    const auto done = [&] {
        const ExecutionState& s = engine_.state();
        return updates_ != before && (!s.isRunning || s.isPaused);
    };
    std::size_t seen = updates_;
    int quiet = 0;
    while (!loop_.runUntil(done, SIZE_MAX, pollWait)) {
        if (updates_ != seen) {
            seen = updates_;
            quiet = 0;
        } else if (++quiet >= quietPolls) {
            break;
        }
    }
    report();
}

void Session::flushOutput() {
    const std::string& output = engine_.state().output;
    if (output.size() < printed_) printed_ = 0;
    if (output.size() > printed_) {
        std::cout << std::string_view(output).substr(printed_) << std::endl;
        printed_ = output.size();
    }
}

void Session::report() {
    flushOutput();
    const ExecutionState& s = engine_.state();
    if (s.isWaitingForInput) {
        std::cout << ansi::notice << "Waiting for input" << ansi::reset << "; use :input CH"
                  << std::endl;
    } else if (s.isPaused || (!s.isRunning && !s.isStopped)) {
        tapevm::printLocation(s);
        if (cfg_.dumpOnPause && s.isPaused && s.tape) tapevm::dumpMemory(*s.tape, s.laneCount);
    } else if (s.isStopped) {
        std::cout << "Program finished";
        if (s.lastRun) {
            std::cout << " (" << s.lastRun->operations << " instructions, " << s.lastRun->seconds
                      << "s)";
        }
        std::cout << std::endl;
    }
}

void Session::replaceProgram(std::vector<std::string> lines) {
    printed_ = 0;
    engine_.setProgram(std::move(lines));
}

bool Session::command(const std::string& input) {
    std::istringstream iss(input.substr(1));
    std::string cmd;
    iss >> cmd;
    if (cmd == "q" || cmd == "quit") {
        return false;
    } else if (cmd == "help") {
        printHelp();
    } else if (cmd == "load") {
        std::string path;
        iss >> path;
        std::ifstream file(path);
        if (!file) {
            printError("File could not be opened: " + path);
            return true;
        }
        std::vector<std::string> lines;
        for (std::string line; std::getline(file, line);) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));
        }
        const std::size_t count = lines.size();
        replaceProgram(std::move(lines));
        std::cout << "Loaded " << count << " lines" << std::endl;
    } else if (cmd == "step") {
        long n = 1;
        if (!(iss >> n)) n = 1;
        if (n <= 0) {
            std::cout << "Invalid count" << std::endl;
            return true;
        }
        if (finished()) return true;
        const std::size_t before = updates_;
        for (long i = 0; i < n; ++i) {
            const std::size_t mark = updates_;
            if (!engine_.step()) break;
            // Worker steps land asynchronously; let each one arrive before the next.
            loop_.runUntil([&] { return updates_ != mark; }, SIZE_MAX, pollWait);
            if (engine_.state().isWaitingForInput) break;
        }
        settle(before);
    } else if (cmd == "run") {
        long ms = static_cast<long>(cfg_.delay.count());
        if (iss >> ms && ms > 0) cfg_.delay = std::chrono::milliseconds(ms);
        start([&] { engine_.run(cfg_.delay); });
    } else if (cmd == "smooth") {
        start([&] { engine_.runSmooth(); });
    } else if (cmd == "go") {
        start([&] { engine_.runImmediately(); });
    } else if (cmd == "turbo") {
        const std::size_t before = updates_;
        printed_ = 0;
        engine_.runTurbo();
        settle(before);
    } else if (cmd == "continue") {
        const std::size_t before = updates_;
        if (engine_.resume()) settle(before);
    } else if (cmd == "pause") {
        engine_.pause();
        report();
    } else if (cmd == "stop") {
        const std::size_t before = updates_;
        engine_.stop();
        settle(before);
    } else if (cmd == "reset") {
        printed_ = 0;
        const std::size_t before = updates_;
        engine_.reset();
        settle(before);
    } else if (cmd == "break") {
        tapevm::Position p;
        if (!readPosition(iss, p)) {
            std::cout << "Usage: :break LINE COL" << std::endl;
        } else {
            const bool set = engine_.toggleBreakpoint(p);
            std::cout << (set ? "Breakpoint set at " : "Breakpoint removed at ") << p.line + 1
                      << ':' << p.column + 1 << std::endl;
        }
    } else if (cmd == "sbreak") {
        tapevm::Position p;
        if (!readPosition(iss, p)) {
            std::cout << "Usage: :sbreak LINE COL" << std::endl;
            return true;
        }
        switch (engine_.toggleSourceBreakpoint(p)) {
            case tapevm::SourceToggle::Added:
                std::cout << "Source breakpoint set" << std::endl;
                break;
            case tapevm::SourceToggle::Removed:
                std::cout << "Source breakpoint removed" << std::endl;
                break;
            case tapevm::SourceToggle::NoCode:
                std::cout << "No code at that source line" << std::endl;
                break;
        }
    } else if (cmd == "clear") {
        engine_.clearBreakpoints();
    } else if (cmd == "input") {
        std::string value;
        std::getline(iss >> std::ws, value);
        // An empty answer is end of input.
        std::uint32_t code = value.empty() ? 0 : static_cast<unsigned char>(value[0]);
        const std::size_t before = updates_;
        if (engine_.provideInput(code)) settle(before);
    } else if (cmd == "dump") {
        const ExecutionState& s = engine_.state();
        if (s.tape) tapevm::dumpMemory(*s.tape, s.laneCount);
    } else if (cmd == "where") {
        tapevm::printLocation(engine_.state());
    } else if (cmd == "size") {
        std::size_t n{};
        if (iss >> n) {
            engine_.setTapeSize(n);
        } else {
            std::cout << "Invalid size" << std::endl;
        }
    } else if (cmd == "bits") {
        unsigned w{};
        if (iss >> w) {
            engine_.setCellWidthBits(w);
        } else {
            std::cout << "Unsupported width" << std::endl;
        }
    } else if (cmd == "lanes") {
        unsigned n{};
        if (iss >> n) {
            engine_.setLaneCount(n);
        } else {
            std::cout << "Invalid lane count" << std::endl;
        }
    } else if (cmd == "inc") {
        std::uint32_t n{};
        if (iss >> n) {
            engine_.setIncrement(n);
        } else {
            std::cout << "Invalid increment" << std::endl;
        }
    } else if (cmd == "autodump") {
        std::string val;
        iss >> val;
        if (val == "on")
            cfg_.dumpOnPause = true;
        else if (val == "off")
            cfg_.dumpOnPause = false;
    } else if (cmd == "save") {
        std::string path;
        iss >> path;
        const ExecutionState& s = engine_.state();
        if (path.empty() || !s.tape) {
            std::cout << "Usage: :save FILE" << std::endl;
        } else {
            tapevm::saveSnapshot(tapevm::takeSnapshot(*s.tape, path), path);
            std::cout << "Saved " << path << std::endl;
        }
    } else if (cmd == "restore") {
        std::string path;
        iss >> path;
        const std::size_t before = updates_;
        tapevm::restoreSnapshot(engine_, tapevm::loadSnapshotFile(path));
        printed_ = 0;
        settle(before);
    } else if (cmd == "sourcemap") {
        std::string path;
        iss >> path;
        engine_.setSourceMap(std::make_shared<tapevm::SourceMapTable>(
            tapevm::SourceMapTable::loadFile(path)));
        std::cout << "Source map loaded" << std::endl;
    } else {
        std::cout << "Unknown command" << std::endl;
    }
    return true;
}

}  // namespace

int runRepl(ExecutionFacade& engine, tapevm::EventLoop& loop, ReplConfig cfg) {
    linenoiseHistorySetMaxLen(historyLen);
    Session session(engine, loop, cfg);
    while (true) {
        char* line = linenoise("$ ");
        if (line == nullptr) {
            std::cout << std::endl;
            break;  // Ctrl-D or Ctrl-C
        }
        std::string input(line);
        linenoiseHistoryAdd(line);
        std::free(line);
        if (input.empty()) continue;
        try {
            if (input[0] == ':') {
                if (!session.command(input)) break;
            } else {
                session.replaceProgram({input});
            }
        } catch (const std::exception& ex) {
            printError(ex.what());
        }
    }
    return 0;
}
#endif  // TAPEVM_ENABLE_REPL
