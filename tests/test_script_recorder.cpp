#include <catch2/catch.hpp>

#include "recorder/script_recorder.hpp"
#include "test_helpers.hpp"

using namespace SimonSays;
using namespace SimonSays::Test;

namespace {

// Drives a recorder through one session on a millisecond clock
class Session {
public:
    Session() : recorder(table) {}

    void start(uint64_t at = 0) {
        now = at;
        REQUIRE(recorder.handleEvent(mouseDown(0, 0, now, TRIGGER_BUTTON)));
        REQUIRE(recorder.handleEvent(mouseUp(0, 0, now, TRIGGER_BUTTON)));
        REQUIRE(recorder.isActive());
    }

    RecordingResult stop() {
        REQUIRE(recorder.handleEvent(mouseDown(0, 0, now, TRIGGER_BUTTON)));
        REQUIRE(recorder.handleEvent(mouseUp(0, 0, now, TRIGGER_BUTTON)));
        REQUIRE_FALSE(recorder.isActive());
        auto finished = recorder.takeFinished();
        REQUIRE(finished);
        return *finished;
    }

    void after(uint64_t ms) { now += ms; }

    void click(int x, int y, uint64_t holdMs = 100, int button = 0) {
        send(mouseDown(x, y, now, button));
        after(holdMs);
        send(mouseUp(x, y, now, button));
    }

    void key(int vkCode, uint32_t modifiers = 0) {
        send(keyDown(vkCode, now, modifiers));
        send(keyUp(vkCode, now, modifiers));
    }

    void typeText(const std::string& text) {
        for (char c : text) {
            auto stroke = keyStrokeForChar(c);
            REQUIRE(stroke);
            key(stroke->vkCode, stroke->shift ? ModifierFlag::SHIFT : 0);
            after(50);
        }
    }

    void send(const InputEvent& event) {
        CHECK_FALSE(recorder.handleEvent(event));
    }

    LocationTable table;
    ScriptRecorder recorder;
    uint64_t now = 0;
};

} // namespace

TEST_CASE("Quick click registers a location and a click", "[recorder]") {
    Session session;
    session.start();
    session.after(100);
    session.click(100, 100, 50);
    RecordingResult result = session.stop();

    CHECK(session.table.find("click_1") == Point{100, 100});
    CHECK(result.newLocations == 1);
    CHECK(result.script == Script{
        Click{MouseButton::Left, std::string("click_1")},
        Wait{UI_SETTLE_WAIT_SECONDS},
    });
}

TEST_CASE("Press and release in different places is a drag", "[recorder]") {
    Session session;
    session.start();
    session.after(100);
    session.send(mouseDown(100, 100, session.now));
    session.after(900);
    session.send(mouseUp(300, 300, session.now));
    RecordingResult result = session.stop();

    CHECK(session.table.size() == 2);
    CHECK(session.table.find("click_1") == Point{100, 100});
    CHECK(session.table.find("click_2") == Point{300, 300});
    CHECK(result.script == Script{
        Drag{MouseButton::Left, "click_1", "click_2"},
        Wait{UI_SETTLE_WAIT_SECONDS},
    });
}

TEST_CASE("Hold length decides click versus click and hold", "[recorder]") {
    Session session;
    session.start();
    session.after(100);

    SECTION("short press") {
        session.click(50, 50, 200);
        RecordingResult result = session.stop();
        CHECK(result.script.front() == Command{Click{MouseButton::Left, std::string("click_1")}});
    }

    SECTION("long press in place") {
        session.click(50, 50, 800);
        RecordingResult result = session.stop();
        CHECK(result.script.front() == Command{ClickAndHold{MouseButton::Left, std::string("click_1"), 0.8}});
    }

    SECTION("long press with a small wobble stays a hold") {
        session.send(mouseDown(50, 50, session.now));
        session.after(830);
        session.send(mouseUp(55, 52, session.now));
        RecordingResult result = session.stop();
        CHECK(result.script.front() == Command{ClickAndHold{MouseButton::Left, std::string("click_1"), 0.8}});
    }

    SECTION("right button") {
        session.click(50, 50, 100, 1);
        RecordingResult result = session.stop();
        CHECK(result.script.front() == Command{Click{MouseButton::Right, std::string("click_1")}});
    }
}

TEST_CASE("Idle gaps become short quantized waits", "[recorder]") {
    CHECK(ScriptRecorder::quantizeIdleGap(0.6) == 0.25);
    CHECK(ScriptRecorder::quantizeIdleGap(1.2) == 0.4);
    CHECK(ScriptRecorder::quantizeIdleGap(2.5) == 0.6);

    Session session;
    session.start();
    session.after(100);
    session.click(100, 100);

    SECTION("0.3s adds nothing") {
        session.after(300);
        session.click(100, 100);
        RecordingResult result = session.stop();
        CHECK(result.script == Script{
            Click{MouseButton::Left, std::string("click_1")}, Wait{0.25},
            Click{MouseButton::Left, std::string("click_1")}, Wait{0.25},
        });
    }

    SECTION("1.2s adds a 0.4s wait") {
        session.after(1200);
        session.click(100, 100);
        RecordingResult result = session.stop();
        CHECK(result.script == Script{
            Click{MouseButton::Left, std::string("click_1")}, Wait{0.25},
            Wait{0.4},
            Click{MouseButton::Left, std::string("click_1")}, Wait{0.25},
        });
    }

    SECTION("2.5s adds a 0.6s wait") {
        session.after(2500);
        session.click(100, 100);
        RecordingResult result = session.stop();
        REQUIRE(result.script.size() == 5);
        CHECK(result.script[2] == Command{Wait{0.6}});
    }
}

TEST_CASE("No wait is emitted before the first command", "[recorder]") {
    Session session;
    session.start();
    session.after(3000);
    session.click(10, 10);
    RecordingResult result = session.stop();
    CHECK(result.script.front() == Command{Click{MouseButton::Left, std::string("click_1")}});
}

TEST_CASE("Clicking somewhere new moves there first", "[recorder]") {
    Session session;
    session.start();
    session.after(100);
    session.click(100, 100);
    session.after(200);
    session.click(400, 100);
    RecordingResult result = session.stop();

    CHECK(result.script == Script{
        Click{MouseButton::Left, std::string("click_1")}, Wait{0.25},
        MoveTo{"click_2"},
        Click{MouseButton::Left, std::string("click_2")}, Wait{0.25},
    });
}

TEST_CASE("Typed characters are batched into one type command", "[recorder]") {
    Session session;
    session.start();
    session.after(100);
    session.typeText("Hi there!");
    session.key(Vk::Return);
    RecordingResult result = session.stop();

    CHECK(result.script == Script{
        Type{"Hi there!"},
        Press{{}, "return"},
        Wait{0.25},
    });
}

TEST_CASE("Backspace edits the buffer before anything is emitted", "[recorder]") {
    Session session;
    session.start();
    session.after(100);
    session.typeText("cat");
    session.key(Vk::Back);
    session.typeText("r");
    RecordingResult result = session.stop();
    CHECK(result.script == Script{Type{"car"}});

    SECTION("with an empty buffer backspace is a key press") {
        Session other;
        other.start();
        other.after(100);
        other.key(Vk::Back);
        CHECK(other.stop().script == Script{Press{{}, "backspace"}});
    }
}

TEST_CASE("Shortcuts flush text and record modifiers", "[recorder]") {
    Session session;
    session.start();
    session.after(100);
    session.typeText("draft");
    session.key('S', ModifierFlag::CTRL);
    session.key('Z', ModifierFlag::CMD | ModifierFlag::SHIFT);
    session.key(Vk::Control, ModifierFlag::CTRL);
    RecordingResult result = session.stop();

    CHECK(result.script == Script{
        Type{"draft"},
        Press{{Modifier::Ctrl}, "s"},
        Press{{Modifier::Cmd, Modifier::Shift}, "z"},
    });
}

TEST_CASE("Shift+return turns buffered text into a code block", "[recorder]") {
    Session session;
    session.start();
    session.after(100);
    session.typeText("if x:");
    session.key(Vk::Return, ModifierFlag::SHIFT);
    session.typeText("    y");
    session.after(100);
    session.click(10, 10);
    RecordingResult result = session.stop();

    REQUIRE(result.script.size() == 3);
    const auto* block = std::get_if<TypeCodeBlock>(&result.script[0]);
    REQUIRE(block);
    CHECK(block->lines == std::vector<std::string>{"if x:", "    y"});
    CHECK(std::holds_alternative<Click>(result.script[1]));
}

TEST_CASE("Long pause flushes text before the wait", "[recorder]") {
    Session session;
    session.start();
    session.after(100);
    session.click(10, 10);
    session.after(100);
    session.typeText("ab");
    session.after(1500);
    session.typeText("c");
    RecordingResult result = session.stop();

    CHECK(result.script == Script{
        Click{MouseButton::Left, std::string("click_1")}, Wait{0.25},
        Type{"ab"},
        Wait{0.4},
        Type{"c"},
    });
}

TEST_CASE("Whitespace-only text is dropped", "[recorder]") {
    Session session;
    session.start();
    session.after(100);
    session.typeText("   ");
    session.after(100);
    session.click(10, 10);
    RecordingResult result = session.stop();
    CHECK(std::holds_alternative<Click>(result.script.front()));
}

TEST_CASE("Events outside a session are ignored", "[recorder]") {
    LocationTable table;
    ScriptRecorder recorder(table);

    CHECK_FALSE(recorder.handleEvent(mouseDown(5, 5, 0)));
    CHECK_FALSE(recorder.handleEvent(keyDown('A', 10)));
    CHECK_FALSE(recorder.isActive());
    CHECK_FALSE(recorder.takeFinished());
    CHECK(table.empty());

    SECTION("pointer motion and wheel events never become commands") {
        Session session;
        session.start();
        InputEvent move;
        move.type = InputEventType::MouseMove;
        move.timestamp = 5000;
        session.send(move);
        InputEvent wheel;
        wheel.type = InputEventType::MouseWheel;
        wheel.wheelDelta = 120;
        wheel.timestamp = 6000;
        session.send(wheel);
        CHECK(session.stop().script.empty());
    }
}

TEST_CASE("Starting a session resets its state", "[recorder]") {
    Session session;
    session.start();
    session.after(100);
    session.typeText("first");
    session.click(10, 10);
    RecordingResult first = session.stop();
    CHECK(first.script.size() == 3);

    session.after(1000);
    session.start(session.now);
    session.after(100);
    session.click(10, 10);
    RecordingResult second = session.stop();

    CHECK(second.newLocations == 0);
    CHECK(second.script == Script{Click{MouseButton::Left, std::string("click_1")}, Wait{0.25}});
}
