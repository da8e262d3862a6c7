#include <catch2/catch.hpp>

#include "core/script_codec.hpp"

using namespace SimonSays;

namespace {

Command parseOne(const std::string& line) {
    std::string error;
    auto command = parseCommand(line, error);
    INFO(line << " -> " << error);
    REQUIRE(command);
    return *command;
}

} // namespace

TEST_CASE("Type followed by a shortcut parses into two commands", "[codec]") {
    ParseResult result = parseScript("type \"Hello\"\npress cmd+s\n");

    CHECK(result.diagnostics.empty());
    REQUIRE(result.script.size() == 2);
    CHECK(result.script[0] == Command{Type{"Hello"}});
    CHECK(result.script[1] == Command{Press{{Modifier::Cmd}, "s"}});
}

TEST_CASE("Every command form parses", "[codec]") {
    CHECK(parseOne("move mouse to click_3") == Command{MoveTo{"click_3"}});
    CHECK(parseOne("move mouse to (100, 200)") == Command{MoveTo{"(100, 200)"}});
    CHECK(parseOne("left click") == Command{Click{MouseButton::Left, std::nullopt}});
    CHECK(parseOne("right click at menu") == Command{Click{MouseButton::Right, std::string("menu")}});
    CHECK(parseOne("left click and hold at knob for 0.8s")
          == Command{ClickAndHold{MouseButton::Left, std::string("knob"), 0.8}});
    CHECK(parseOne("left click and hold at knob")
          == Command{ClickAndHold{MouseButton::Left, std::string("knob"), DEFAULT_HOLD_DURATION}});
    CHECK(parseOne("drag right from a to b") == Command{Drag{MouseButton::Right, "a", "b"}});
    CHECK(parseOne("press return") == Command{Press{{}, "return"}});
    CHECK(parseOne("press shift+cmd+z") == Command{Press{{Modifier::Cmd, Modifier::Shift}, "z"}});
    CHECK(parseOne("press control + alt + delete")
          == Command{Press{{Modifier::Ctrl, Modifier::Option}, "delete"}});
    CHECK(parseOne("type line 'ls -la'") == Command{TypeLine{"ls -la"}});
    CHECK(parseOne("wait 1.5") == Command{Wait{1.5}});
    CHECK(parseOne("sleep 2s") == Command{Wait{2.0}});
    CHECK(parseOne("# just a note") == Command{Comment{"just a note"}});
}

TEST_CASE("Keywords are case-insensitive", "[codec]") {
    CHECK(parseOne("LEFT Click AT save") == Command{Click{MouseButton::Left, std::string("save")}});
    CHECK(parseOne("Press CMD+S") == Command{Press{{Modifier::Cmd}, "s"}});
    CHECK(parseOne("WAIT 0.25") == Command{Wait{0.25}});
}

TEST_CASE("Quoted text loses exactly one matching pair", "[codec]") {
    CHECK(unquote("\"hi\"") == "hi");
    CHECK(unquote("'hi'") == "hi");
    CHECK(unquote("\"'hi'\"") == "'hi'");
    CHECK(unquote("\"hi'") == "\"hi'");
    CHECK(unquote("hi") == "hi");
    CHECK(unquote("\"") == "\"");

    CHECK(parseOne("type \"say \"cheese\"\"") == Command{Type{"say \"cheese\""}});
}

TEST_CASE("Bad lines are reported and skipped", "[codec]") {
    ParseResult result = parseScript(
        "left click at a\n"
        "jump to the moon\n"
        "press hyper+x\n"
        "press cmd+nosuchkey\n"
        "wait soon\n"
        "left click and hold for -1s\n"
        "drag middle from a to b\n"
        "right click at b\n");

    REQUIRE(result.script.size() == 2);
    CHECK(result.script[0] == Command{Click{MouseButton::Left, std::string("a")}});
    CHECK(result.script[1] == Command{Click{MouseButton::Right, std::string("b")}});

    REQUIRE(result.diagnostics.size() == 6);
    CHECK(result.diagnostics[0].line == 2);
    CHECK(result.diagnostics[1].line == 3);
    CHECK(result.diagnostics[4].line == 6);
    CHECK(result.diagnostics[5].line == 7);
}

TEST_CASE("Code blocks keep their lines verbatim", "[codec]") {
    ParseResult result = parseScript(
        "type code block\n"
        "```\n"
        "def greet(name):\n"
        "    # not a comment command\n"
        "    return f\"hi {name}\"\n"
        "\n"
        "```\n"
        "press return\n");

    CHECK(result.diagnostics.empty());
    REQUIRE(result.script.size() == 2);
    const auto* block = std::get_if<TypeCodeBlock>(&result.script[0]);
    REQUIRE(block);
    CHECK(block->lines == std::vector<std::string>{
        "def greet(name):",
        "    # not a comment command",
        "    return f\"hi {name}\"",
        "",
    });
    CHECK(result.script[1] == Command{Press{{}, "return"}});

    SECTION("a missing closing fence is reported but the block is kept") {
        ParseResult open = parseScript("type code block\n```\nx = 1\n");
        REQUIRE(open.script.size() == 1);
        CHECK(std::get<TypeCodeBlock>(open.script[0]).lines == std::vector<std::string>{"x = 1", ""});
        CHECK(open.diagnostics.size() == 1);
    }

    SECTION("a missing opening fence is reported") {
        ParseResult bare = parseScript("type code block\nx = 1\n");
        CHECK(bare.diagnostics.size() == 2);
        CHECK(bare.script.empty());
    }
}

TEST_CASE("Recording headers parse as comments", "[codec]") {
    ParseResult result = parseScript(
        "# Recording ID: rec1\n"
        "# Duration: 3.2 seconds\n"
        "\n"
        "left click at click_1\n");

    CHECK(result.diagnostics.empty());
    REQUIRE(result.script.size() == 3);
    CHECK(isComment(result.script[0]));
    CHECK(isComment(result.script[1]));
    CHECK_FALSE(isComment(result.script[2]));
}

TEST_CASE("Formatted scripts parse back to the same commands", "[codec]") {
    Script script = {
        MoveTo{"click_2"},
        Click{MouseButton::Left, std::string("click_1")},
        ClickAndHold{MouseButton::Right, std::string("click_2"), 0.8},
        Drag{MouseButton::Left, "click_1", "click_2"},
        Press{{Modifier::Cmd, Modifier::Shift}, "t"},
        Press{{}, "escape"},
        Type{"Hello, world"},
        TypeLine{"echo done"},
        TypeCodeBlock{{"if x:", "    y()"}},
        Wait{0.25},
        Wait{0.1234567},
        Wait{1234567.0},
        ClickAndHold{MouseButton::Left, std::string("click_1"), 2.3456789},
        Comment{"end"},
    };

    std::string text = formatScript(script);
    ParseResult parsed = parseScript(text);

    CHECK(parsed.diagnostics.empty());
    CHECK(parsed.script == script);
}

TEST_CASE("Commands format in script syntax", "[codec]") {
    CHECK(formatCommand(Click{MouseButton::Left, std::string("click_1")}) == "left click at click_1");
    CHECK(formatCommand(ClickAndHold{MouseButton::Left, std::string("click_1"), 0.8})
          == "left click and hold at click_1 for 0.8s");
    CHECK(formatCommand(Press{{Modifier::Ctrl}, "c"}) == "press ctrl+c");
    CHECK(formatCommand(Wait{0.25}) == "wait 0.25");
    CHECK(formatCommand(Wait{0.1234567}) == "wait 0.1234567");
    CHECK(formatCommand(Wait{1234567.0}) == "wait 1234567");
    CHECK(formatCommand(Wait{1.0}) == "wait 1");
    CHECK(formatCommand(TypeCodeBlock{{"a", "  b"}}) == "type code block\n```\na\n  b\n```");
}
