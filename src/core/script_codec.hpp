#pragma once

#include "core/command.hpp"

#include <optional>
#include <string>
#include <vector>

namespace SimonSays {

// A line the parser could not use. Parsing continues past it.
struct ParseDiagnostic {
    int line = 0;  // 1-based
    std::string message;
};

struct ParseResult {
    Script script;
    std::vector<ParseDiagnostic> diagnostics;
};

/**
 * Parse script text.
 *
 * One command per line, keywords case-insensitive. "type code block" is
 * followed by a ``` fence; every line up to the closing fence is taken
 * verbatim. Unknown keywords, bad arguments and unknown key names are
 * reported in diagnostics and the line is skipped. Never throws for content.
 */
ParseResult parseScript(const std::string& text);

// Parse one single-line command. On failure returns nullopt and sets error.
// "type code block" is not a single-line command.
std::optional<Command> parseCommand(const std::string& line, std::string& error);

// Script text for one command (a code block spans several lines)
std::string formatCommand(const Command& command);

// Script text for a whole script, one command per line
std::string formatScript(const Script& script);

// Remove exactly one matching pair of single or double quotes
std::string unquote(const std::string& text);

} // namespace SimonSays
