#include "script_codec.hpp"
#include "utils/strings.hpp"

#include <cctype>
#include <stdexcept>
#include <type_traits>

namespace SimonSays {

namespace {

// Walks a command line word by word while keeping the original text
// available for names and quoted arguments.
class LineTokenizer {
public:
    explicit LineTokenizer(const std::string& line) : m_line(line) {}

    std::string next() {
        skipSpace();
        size_t start = m_pos;
        while (m_pos < m_line.size() && !std::isspace(static_cast<unsigned char>(m_line[m_pos]))) {
            m_pos++;
        }
        return m_line.substr(start, m_pos - start);
    }

    // Next word lowercased, without consuming it
    std::string peekKeyword() {
        size_t saved = m_pos;
        std::string word = next();
        m_pos = saved;
        return toLower(word);
    }

    bool acceptKeyword(const std::string& keyword) {
        if (peekKeyword() != keyword) {
            return false;
        }
        next();
        return true;
    }

    std::string rest() {
        std::string remainder = trim(m_line.substr(m_pos));
        m_pos = m_line.size();
        return remainder;
    }

    bool atEnd() {
        skipSpace();
        return m_pos >= m_line.size();
    }

private:
    void skipSpace() {
        while (m_pos < m_line.size() && std::isspace(static_cast<unsigned char>(m_line[m_pos]))) {
            m_pos++;
        }
    }

    std::string m_line;
    size_t m_pos = 0;
};

bool parseSeconds(std::string text, double& seconds) {
    text = toLower(text);
    if (!text.empty() && text.back() == 's') {
        text.pop_back();
    }
    if (text.empty()) {
        return false;
    }
    try {
        size_t used = 0;
        seconds = std::stod(text, &used);
        return used == text.size() && seconds >= 0.0;
    } catch (const std::exception&) {
        return false;
    }
}

bool isCodeBlockHeader(const std::string& trimmedLine) {
    return startsWith(toLower(trimmedLine), "type code block");
}

bool isFence(const std::string& line) {
    return trim(line) == Keyword::CODE_FENCE;
}

std::optional<Command> parseMove(LineTokenizer& tokens, std::string& error) {
    if (!tokens.acceptKeyword("mouse") || !tokens.acceptKeyword("to")) {
        error = "expected 'move mouse to <location>'";
        return std::nullopt;
    }
    std::string target = tokens.rest();
    if (target.empty()) {
        error = "missing move target";
        return std::nullopt;
    }
    return MoveTo{target};
}

std::optional<Command> parseClick(MouseButton button, LineTokenizer& tokens, std::string& error) {
    if (!tokens.acceptKeyword(Keyword::CLICK)) {
        error = "expected '" + buttonName(button) + " click'";
        return std::nullopt;
    }

    bool hold = false;
    if (tokens.acceptKeyword("and")) {
        if (!tokens.acceptKeyword("hold")) {
            error = "expected 'and hold'";
            return std::nullopt;
        }
        hold = true;
    }

    std::optional<std::string> location;
    double duration = DEFAULT_HOLD_DURATION;
    bool sawDuration = false;

    while (!tokens.atEnd()) {
        std::string word = toLower(tokens.next());
        if (word == "at" && !location) {
            std::string name = tokens.next();
            if (name.empty()) {
                error = "missing location after 'at'";
                return std::nullopt;
            }
            location = name;
        } else if (word == "for" && hold && !sawDuration) {
            std::string value = tokens.next();
            if (!parseSeconds(value, duration)) {
                error = "bad hold duration '" + value + "'";
                return std::nullopt;
            }
            sawDuration = true;
        } else {
            error = "unexpected '" + word + "'";
            return std::nullopt;
        }
    }

    if (hold) {
        return ClickAndHold{button, location, duration};
    }
    return Click{button, location};
}

std::optional<Command> parseDrag(LineTokenizer& tokens, std::string& error) {
    auto button = parseButton(tokens.next());
    if (!button) {
        error = "expected 'drag <left|right>'";
        return std::nullopt;
    }
    if (!tokens.acceptKeyword("from")) {
        error = "expected 'from'";
        return std::nullopt;
    }
    std::string from = tokens.next();
    if (from.empty() || !tokens.acceptKeyword("to")) {
        error = "expected 'drag " + buttonName(*button) + " from <location> to <location>'";
        return std::nullopt;
    }
    std::string to = tokens.next();
    if (to.empty() || !tokens.atEnd()) {
        error = "expected a single destination location";
        return std::nullopt;
    }
    return Drag{*button, from, to};
}

std::optional<Command> parsePress(LineTokenizer& tokens, std::string& error) {
    std::string combination = tokens.rest();
    if (combination.empty()) {
        error = "missing key";
        return std::nullopt;
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t plus = combination.find('+', start);
        if (plus == std::string::npos) {
            parts.push_back(trim(combination.substr(start)));
            break;
        }
        parts.push_back(trim(combination.substr(start, plus - start)));
        start = plus + 1;
    }

    std::string key = toLower(parts.back());
    parts.pop_back();
    if (key.empty() || !keyCodeForName(key)) {
        error = "unknown key '" + key + "'";
        return std::nullopt;
    }

    std::vector<Modifier> modifiers;
    for (const auto& part : parts) {
        auto modifier = parseModifier(part);
        if (!modifier) {
            error = "unknown modifier '" + part + "'";
            return std::nullopt;
        }
        modifiers.push_back(*modifier);
    }

    return Press{normalizeModifiers(std::move(modifiers)), key};
}

std::optional<Command> parseWait(LineTokenizer& tokens, std::string& error) {
    std::string value = tokens.next();
    double seconds = 0.0;
    if (!parseSeconds(value, seconds)) {
        error = "bad duration '" + value + "'";
        return std::nullopt;
    }
    return Wait{seconds};
}

} // namespace

std::string unquote(const std::string& text) {
    if (text.size() >= 2) {
        char first = text.front();
        if ((first == '"' || first == '\'') && text.back() == first) {
            return text.substr(1, text.size() - 2);
        }
    }
    return text;
}

std::optional<Command> parseCommand(const std::string& line, std::string& error) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        error = "empty line";
        return std::nullopt;
    }

    if (trimmed[0] == '#') {
        return Comment{trim(trimmed.substr(1))};
    }

    LineTokenizer tokens(trimmed);
    std::string keyword = toLower(tokens.next());

    if (keyword == Keyword::MOVE) {
        return parseMove(tokens, error);
    }
    if (auto button = parseButton(keyword)) {
        return parseClick(*button, tokens, error);
    }
    if (keyword == Keyword::DRAG) {
        return parseDrag(tokens, error);
    }
    if (keyword == Keyword::PRESS) {
        return parsePress(tokens, error);
    }
    if (keyword == Keyword::TYPE) {
        if (tokens.peekKeyword() == "code") {
            error = "'type code block' must be followed by a fenced block";
            return std::nullopt;
        }
        if (tokens.acceptKeyword("line")) {
            return TypeLine{unquote(tokens.rest())};
        }
        return Type{unquote(tokens.rest())};
    }
    if (keyword == Keyword::WAIT || keyword == Keyword::SLEEP) {
        return parseWait(tokens, error);
    }

    error = "unknown command '" + keyword + "'";
    return std::nullopt;
}

ParseResult parseScript(const std::string& text) {
    ParseResult result;
    std::vector<std::string> lines = splitLines(text);

    size_t i = 0;
    while (i < lines.size()) {
        int lineNumber = static_cast<int>(i) + 1;
        std::string trimmed = trim(lines[i]);

        if (trimmed.empty()) {
            i++;
            continue;
        }

        if (isCodeBlockHeader(trimmed)) {
            i++;
            while (i < lines.size() && trim(lines[i]).empty()) {
                i++;
            }
            if (i >= lines.size() || !isFence(lines[i])) {
                result.diagnostics.push_back({lineNumber, "'type code block' without an opening ``` fence"});
                continue;
            }
            i++;

            TypeCodeBlock block;
            while (i < lines.size() && !isFence(lines[i])) {
                block.lines.push_back(lines[i]);
                i++;
            }
            if (i >= lines.size()) {
                result.diagnostics.push_back({lineNumber, "code block is missing its closing ``` fence"});
            } else {
                i++;
            }
            result.script.push_back(std::move(block));
            continue;
        }

        std::string error;
        if (auto command = parseCommand(trimmed, error)) {
            result.script.push_back(std::move(*command));
        } else {
            result.diagnostics.push_back({lineNumber, error + ": " + trimmed});
        }
        i++;
    }

    return result;
}

std::string formatCommand(const Command& command) {
    return std::visit([](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, MoveTo>) {
            return "move mouse to " + c.target;
        } else if constexpr (std::is_same_v<T, Click>) {
            std::string text = buttonName(c.button) + " click";
            if (c.location) text += " at " + *c.location;
            return text;
        } else if constexpr (std::is_same_v<T, ClickAndHold>) {
            std::string text = buttonName(c.button) + " click and hold";
            if (c.location) text += " at " + *c.location;
            return text + " for " + formatSeconds(c.duration) + "s";
        } else if constexpr (std::is_same_v<T, Drag>) {
            return "drag " + buttonName(c.button) + " from " + c.from + " to " + c.to;
        } else if constexpr (std::is_same_v<T, Press>) {
            std::string text = "press ";
            for (Modifier modifier : c.modifiers) {
                text += modifierName(modifier) + "+";
            }
            return text + c.key;
        } else if constexpr (std::is_same_v<T, Type>) {
            return "type \"" + c.text + "\"";
        } else if constexpr (std::is_same_v<T, TypeLine>) {
            return "type line \"" + c.text + "\"";
        } else if constexpr (std::is_same_v<T, TypeCodeBlock>) {
            std::string text = "type code block\n";
            text += Keyword::CODE_FENCE;
            text += "\n";
            for (const auto& line : c.lines) {
                text += line + "\n";
            }
            return text + Keyword::CODE_FENCE;
        } else if constexpr (std::is_same_v<T, Wait>) {
            return "wait " + formatSeconds(c.seconds);
        } else {
            return c.text.empty() ? "#" : "# " + c.text;
        }
    }, command);
}

std::string formatScript(const Script& script) {
    std::string text;
    for (const auto& command : script) {
        text += formatCommand(command);
        text += "\n";
    }
    return text;
}

} // namespace SimonSays
