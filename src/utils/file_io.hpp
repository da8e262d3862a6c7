#pragma once

#include <string>

namespace SimonSays {

// Read a whole file; throws std::runtime_error if it cannot be opened
std::string readFile(const std::string& path);

// Write through a temporary file and rename it into place, so a failed
// write never leaves a truncated file behind. Throws std::runtime_error.
void writeFileAtomic(const std::string& path, const std::string& contents);

} // namespace SimonSays
