#include <catch2/catch_test_macros.hpp>

#include <tclinter/tree/window.h>

#include "recording_interpreter.h"

#include <algorithm>

using namespace tclinter;
using tclinter::testing::RecordingSession;

namespace {
    Callback constant(std::string value) {
        return [value = std::move(value)](const Tokens &) { return Tokens{value}; };
    }

    std::vector<std::string> destroy_calls(const tclinter::testing::RecordingInterpreter &recorder) {
        std::vector<std::string> paths;
        for (const auto &call : recorder.calls) {
            if (call.front() == "destroy") { paths.push_back(call.at(1)); }
        }
        return paths;
    }
} // namespace

TEST_CASE("Widget - path names", "[tree][widget]") {
    RecordingSession root;

    SECTION("an explicit name, then a derived one") {
        auto &named = Widget::create(*root.session, "Button", "button", Options{{"name", "button"}});
        auto &derived = Widget::create(*root.session, "Button", "button");
        REQUIRE(named.path_name() == ".root!button.");
        REQUIRE(derived.path_name() == ".root!button1.");
        REQUIRE_FALSE(named.instance_index().has_value());
    }

    SECTION("derived names never collide") {
        auto &a = Widget::create(*root.session, "Button", "button");
        auto &b = Widget::create(*root.session, "Button", "button");
        auto &c = Widget::create(*root.session, "Button", "button");
        REQUIRE(a.path_name() == ".root!button.");
        REQUIRE(b.path_name() == ".root!button1.");
        REQUIRE(c.path_name() == ".root!button2.");

        a.destroy();
        auto &d = Widget::create(*root.session, "Button", "button");
        REQUIRE(d.path_name() == ".root!button3.");

        std::vector<std::string> paths;
        for (auto *w : root.session->children().members()) { paths.push_back(w->path_name()); }
        std::sort(paths.begin(), paths.end());
        REQUIRE(std::adjacent_find(paths.begin(), paths.end()) == paths.end());
    }

    SECTION("nested widgets extend the parent path") {
        auto &frame = Widget::create(*root.session, "Frame", "frame");
        auto &label = Widget::create(frame, "Label", "label");
        REQUIRE(label.path_name() == ".root!frame.!label.");
        REQUIRE(&label.parent() == &frame);
        REQUIRE(frame.children().contains(label));
    }

    SECTION("an empty name falls back to the derived one") {
        auto &w = Widget::create(*root.session, "Entry", "entry", Options{{"name", ""}});
        REQUIRE(w.path_name() == ".root!entry.");
    }

    SECTION("the name must be a single word") {
        REQUIRE_THROWS_AS(Widget::create(*root.session, "Entry", "entry", Options{{"name", Tokens{"a", "b"}}}),
                          UnsupportedTypeError);
        REQUIRE_THROWS_AS(Widget::create(*root.session, "Entry", "entry",
                                         Options{{"name", CallbackGroup{constant("x")}}}),
                          UnsupportedTypeError);
        REQUIRE(root.session->children().empty());
        REQUIRE(root.recorder->calls.empty());
    }
}

TEST_CASE("Widget - one creation instruction with the flags in order", "[tree][widget]") {
    RecordingSession root;
    auto &button = Widget::create(*root.session, "Button", "button",
                                  Options{{"text", "Press me"}, {"command", CallbackGroup{constant("pressed")}},
                                          {"width", 12}});

    REQUIRE(root.recorder->calls.size() == 1);
    REQUIRE(root.recorder->calls.front() == Tokens{"button", ".root!button.", "-text", "Press me", "-width", "12"});

    SECTION("callbacks are registered commands, not flags") {
        REQUIRE(root.recorder->created.size() == 1);
        REQUIRE(button.commands().contains("command"));
        auto name = button.commands().resolve("command");
        REQUIRE(root.recorder->call({name}) == "pressed");
    }
}

TEST_CASE("Widget - configure and cget", "[tree][widget]") {
    RecordingSession root;
    auto &label = Widget::create(*root.session, "Label", "label", Options{{"text", "Hi"}});
    root.recorder->calls.clear();

    label.configure({{"text", "Bye"}, {"anchor", "w"}});
    REQUIRE(root.recorder->calls.back() == Tokens{".root!label.", "configure", "-text", "Bye", "-anchor", "w"});
    REQUIRE(label.commands().flag("text") == Tokens{"-text", "Bye"});

    label.configure({{"command", CallbackGroup{constant("x")}}});
    REQUIRE(root.recorder->calls.size() == 1);

    root.recorder->responses[".root!label. cget"] = "Bye";
    REQUIRE(label.cget("text") == "Bye");
    REQUIRE(root.recorder->calls.back() == Tokens{".root!label.", "cget", "-text"});
}

TEST_CASE("Widget - destroy is post order", "[tree][widget]") {
    RecordingSession root;
    auto &frame = Widget::create(*root.session, "Frame", "frame", Options{{"command", CallbackGroup{constant("f")}}});
    Widget::create(frame, "Button", "button");
    auto &inner = Widget::create(frame, "Frame", "frame");
    Widget::create(inner, "Label", "label");
    auto frame_command = frame.commands().resolve("command");

    frame.destroy();

    REQUIRE(destroy_calls(*root.recorder) == std::vector<std::string>{
        ".root!frame.!frame1.!label.", ".root!frame.!frame1.", ".root!frame.!button.", ".root!frame."});
    auto &journal = root.recorder->journal;
    REQUIRE(journal.back() == "destroy .root!frame.");
    REQUIRE(journal[journal.size() - 2] == "delete " + frame_command);

    REQUIRE(root.session->children().empty());
    REQUIRE(root.session->instance_tracker().count("Frame") == 0);
    REQUIRE(root.session->instance_tracker().count("Label") == 0);
}

TEST_CASE("Widget - a callback may destroy its own widget", "[tree][widget]") {
    RecordingSession root;
    Widget *self{nullptr};
    std::vector<Tokens> logged;

    // The chain runs last to first, so close tears the widget down before log sees its result
    Callback log = [&logged](const Tokens &args) {
        logged.push_back(args);
        return args;
    };
    Callback close = [&self](const Tokens &) {
        self->destroy();
        return Tokens{"closed"};
    };

    auto &button = Widget::create(*root.session, "Button", "button", Options{{"command", CallbackGroup{log, close}}});
    self = &button;
    auto command = button.commands().resolve("command");

    REQUIRE(root.recorder->call({command, "click"}) == "closed");

    REQUIRE(logged == std::vector<Tokens>{Tokens{"closed"}});
    REQUIRE(root.session->children().empty());
    REQUIRE(destroy_calls(*root.recorder) == std::vector<std::string>{".root!button."});
    REQUIRE(std::find(root.recorder->deleted.begin(), root.recorder->deleted.end(), command) !=
            root.recorder->deleted.end());
    REQUIRE_FALSE(root.recorder->commands.contains(command));
}

TEST_CASE("Widget - parent requirements", "[tree][widget]") {
    SECTION("a parent without an interpreter") {
        auto bare = std::make_shared<InterpreterSession>();
        REQUIRE(bare->has_path_name());
        REQUIRE_THROWS_AS(Widget::create(*bare, "Button", "button"), StructuralError);
    }

    SECTION("a destroyed parent") {
        RecordingSession root;
        root.session->destroy();
        REQUIRE_THROWS_AS(Widget::create(*root.session, "Button", "button"), StructuralError);
    }

    SECTION("the interpreter rejects the creation") {
        RecordingSession root;
        root.recorder->fail_on = "bogus";
        REQUIRE_THROWS_AS(Widget::create(*root.session, "Bogus", "bogus", Options{{"command", CallbackGroup{constant("x")}}}),
                          InterpreterError);
        REQUIRE(root.session->children().empty());
        REQUIRE(root.session->instance_tracker().count("Bogus") == 0);
        REQUIRE(root.recorder->commands.empty());
    }
}

TEST_CASE("Widget - parent and name are fixed", "[tree][widget]") {
    RecordingSession root;
    RecordingSession other;
    auto &button = Widget::create(*root.session, "Button", "button");

    REQUIRE_THROWS_AS(button.set_parent(*other.session), InstantiatedError);
    REQUIRE(&button.parent() == root.session.get());

    REQUIRE_THROWS_AS(button.set_path_name(".elsewhere."), InstantiatedError);
    REQUIRE(button.path_name() == ".root!button.");
}

TEST_CASE("Widget - destroying a child leaves the parent intact", "[tree][widget]") {
    RecordingSession root;
    auto &frame = Widget::create(*root.session, "Frame", "frame");
    auto &label = Widget::create(frame, "Label", "label");
    REQUIRE(frame.children().size() == 1);

    label.destroy();

    REQUIRE(frame.children().empty());
    REQUIRE_FALSE(frame.is_destroyed());
    REQUIRE(destroy_calls(*root.recorder) == std::vector<std::string>{".root!frame.!label."});
}

TEST_CASE("Widget - a destroyed widget cannot be configured", "[tree][widget]") {
    RecordingSession root;
    // Not adopted by the session, so destroy() leaves the object to this scope
    Widget loose{*root.session, "Label", "label"};
    loose.destroy();
    loose.destroy();

    REQUIRE(loose.is_destroyed());
    REQUIRE(destroy_calls(*root.recorder) == std::vector<std::string>{".root!label."});
    REQUIRE_THROWS_AS(loose.configure({{"text", "x"}}), StructuralError);
}

TEST_CASE("Window - a toplevel widget", "[tree][widget]") {
    RecordingSession root;
    auto &window = Widget::create<Window>(*root.session, Options{{"width", 200}});
    REQUIRE(window.kind() == "toplevel");
    REQUIRE(window.class_name() == "Window");
    REQUIRE(window.path_name() == ".root!window.");
    REQUIRE(root.recorder->calls.front() == Tokens{"toplevel", ".root!window.", "-width", "200"});
}
