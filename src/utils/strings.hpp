#pragma once

#include <string>
#include <vector>

namespace SimonSays {

std::string toLower(const std::string& text);

// Strip spaces, tabs and line endings from both ends
std::string trim(const std::string& text);

// Strip spaces and tabs from the end only
std::string trimRight(const std::string& text);

bool startsWith(const std::string& text, const std::string& prefix);

// Split on '\n', dropping a trailing '\r' from each line
std::vector<std::string> splitLines(const std::string& text);

// Seconds in the shortest form that parses back exactly: 0.25, 0.6, 1
std::string formatSeconds(double seconds);

} // namespace SimonSays
