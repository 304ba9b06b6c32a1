#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <tclinter/interpreter/command_trace.h>

#include "recording_interpreter.h"

#include <cstdio>
#include <unistd.h>

using namespace tclinter;
using tclinter::testing::RecordingInterpreter;

namespace {
    // Redirects stdout into a temporary file while in scope
    struct CapturedStdout {
        CapturedStdout() : _file{std::tmpfile()}, _saved{dup(fileno(stdout))} {
            std::fflush(stdout);
            dup2(fileno(_file), fileno(stdout));
        }

        ~CapturedStdout() {
            if (_saved >= 0) { restore(); }
            std::fclose(_file);
        }

        std::string text() {
            restore();
            std::rewind(_file);
            std::string result;
            for (int c = std::fgetc(_file); c != EOF; c = std::fgetc(_file)) { result.push_back(static_cast<char>(c)); }
            return result;
        }

    private:
        void restore() {
            if (_saved < 0) { return; }
            std::fflush(stdout);
            dup2(_saved, fileno(stdout));
            close(_saved);
            _saved = -1;
        }

        std::FILE *_file;
        int _saved;
    };
} // namespace

TEST_CASE("CommandTrace - counts every call", "[interpreter][trace]") {
    RecordingInterpreter interpreter;
    auto trace = std::make_shared<CommandTrace>(std::nullopt, false, false, false);
    interpreter.set_trace(trace);

    interpreter.call({"button", ".root!button."});
    interpreter.call({"destroy", ".root!button."});
    REQUIRE(trace->call_count() == 2);
}

TEST_CASE("CommandTrace - prints calls, results and failures", "[interpreter][trace]") {
    CommandTrace::set_use_logger(false);
    RecordingInterpreter interpreter;
    interpreter.responses[".root!label. cget"] = "Hello";
    interpreter.fail_on = "bogus";
    interpreter.set_trace(std::make_shared<CommandTrace>());

    std::string output;
    {
        CapturedStdout capture;
        interpreter.call({".root!label.", "cget", "-text"});
        REQUIRE_THROWS_AS(interpreter.call({"bogus", "x"}), InterpreterError);
        output = capture.text();
    }
    CommandTrace::set_use_logger(true);

    REQUIRE_THAT(output, Catch::Matchers::ContainsSubstring("[1] Calling: .root!label. cget -text"));
    REQUIRE_THAT(output, Catch::Matchers::ContainsSubstring("[1] Completed: .root!label. cget -text -> 'Hello'"));
    REQUIRE_THAT(output, Catch::Matchers::ContainsSubstring("[2] Calling: bogus x"));
    REQUIRE_THAT(output, Catch::Matchers::ContainsSubstring("[2] FAILED: bogus x -> invalid command name"));
}

TEST_CASE("CommandTrace - the filter selects instructions", "[interpreter][trace]") {
    CommandTrace::set_use_logger(false);
    RecordingInterpreter interpreter;
    auto trace = std::make_shared<CommandTrace>(std::string{"destroy"});
    interpreter.set_trace(trace);

    std::string output;
    {
        CapturedStdout capture;
        interpreter.call({"button", ".root!button."});
        interpreter.call({"destroy", ".root!button."});
        output = capture.text();
    }
    CommandTrace::set_use_logger(true);

    REQUIRE(trace->call_count() == 2);
    REQUIRE_THAT(output, !Catch::Matchers::ContainsSubstring("Calling: button"));
    REQUIRE_THAT(output, Catch::Matchers::ContainsSubstring("[2] Calling: destroy .root!button."));
}
