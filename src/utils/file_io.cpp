#include "file_io.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace SimonSays {

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void writeFileAtomic(const std::string& path, const std::string& contents) {
    fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("cannot create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("cannot write: " + temp.string());
        }
        file << contents;
        file.flush();
        if (!file) {
            throw std::runtime_error("write failed: " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw std::runtime_error("cannot replace " + path);
    }
}

} // namespace SimonSays
