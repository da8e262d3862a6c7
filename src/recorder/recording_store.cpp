#include "recording_store.hpp"
#include "utils/file_io.hpp"
#include "utils/strings.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace SimonSays {

namespace {

std::string formatLocalTime(const char* format) {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif
    std::ostringstream ss;
    ss << std::put_time(&local, format);
    return ss.str();
}

// Number after "rec", or -1 for anything else
int recordingNumber(const std::string& name) {
    if (!startsWith(name, "rec") || name.size() == 3) {
        return -1;
    }
    std::string digits = name.substr(3);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return -1;
    }
    try {
        return std::stoi(digits);
    } catch (const std::exception&) {
        return -1;
    }
}

std::string joinPath(const std::string& folder, const char* file) {
    return (fs::path(folder) / file).string();
}

} // namespace

std::string infoToJson(const RecordingInfo& info) {
    json j;
    j["id"] = info.id;
    j["created"] = info.created;
    j["duration"] = info.duration;
    j["commands"] = info.commands;
    j["locations"] = info.locations;
    j["description"] = info.description;
    return j.dump(2) + "\n";
}

RecordingInfo infoFromJson(const std::string& text) {
    RecordingInfo info;
    try {
        json j = json::parse(text);
        info.id = j.value("id", "");
        info.created = j.value("created", "unknown");
        info.duration = j.value("duration", 0.0);
        info.commands = j.value("commands", 0);
        info.locations = j.value("locations", 0);
        info.description = j.value("description", "No description");
    } catch (const json::exception& e) {
        throw std::runtime_error(e.what());
    }
    return info;
}

RecordingStore::RecordingStore(std::string root) : m_root(std::move(root)) {
}

std::string RecordingStore::nextRecordingId() const {
    int highest = 0;
    std::error_code ec;
    if (fs::is_directory(m_root, ec)) {
        for (const auto& entry : fs::directory_iterator(m_root, ec)) {
            if (!entry.is_directory()) {
                continue;
            }
            highest = std::max(highest, recordingNumber(entry.path().filename().string()));
        }
    }
    return "rec" + std::to_string(highest + 1);
}

std::string RecordingStore::folderFor(const std::string& id) const {
    return (fs::path(m_root) / id).string();
}

bool RecordingStore::hasRecording(const std::string& id) const {
    std::error_code ec;
    return fs::is_regular_file(joinPath(folderFor(id), SCRIPT_FILE_NAME), ec);
}

std::string RecordingStore::save(const RecordingResult& result, LocationTable& locations) {
    std::string id = nextRecordingId();
    saveTo(folderFor(id), id, result, locations);
    return id;
}

void RecordingStore::saveTo(const std::string& folder, const std::string& id,
                            const RecordingResult& result, LocationTable& locations) {
    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
        throw std::runtime_error("cannot create " + folder + ": " + ec.message());
    }

    std::string locationsPath = joinPath(folder, LOCATIONS_FILE_NAME);
    if (locations.isDirty() || !fs::exists(locationsPath, ec)) {
        locations.save(locationsPath);
    }

    std::string recordedAt = formatLocalTime("%Y-%m-%d %H:%M:%S");
    writeFileAtomic(joinPath(folder, SCRIPT_FILE_NAME), formatRecordingScript(id, result, recordedAt));

    RecordingInfo info;
    info.id = id;
    info.created = formatLocalTime("%Y-%m-%dT%H:%M:%S");
    info.duration = result.durationSeconds;
    info.commands = static_cast<int>(result.script.size());
    info.locations = result.newLocations;
    info.description = "Recording from " + recordedAt;
    writeFileAtomic(joinPath(folder, INFO_FILE_NAME), infoToJson(info));
}

std::vector<RecordingInfo> RecordingStore::list() const {
    std::vector<RecordingInfo> recordings;
    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) {
        return recordings;
    }

    for (const auto& entry : fs::directory_iterator(m_root, ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        RecordingInfo info;
        info.id = entry.path().filename().string();
        info.description = "No description";
        std::string infoPath = joinPath(entry.path().string(), INFO_FILE_NAME);
        if (fs::exists(infoPath, ec)) {
            try {
                RecordingInfo loaded = infoFromJson(readFile(infoPath));
                loaded.id = info.id;
                info = loaded;
            } catch (const std::exception& e) {
                std::cerr << "[WARN] Unreadable " << infoPath << ": " << e.what() << std::endl;
            }
        }
        recordings.push_back(info);
    }

    std::sort(recordings.begin(), recordings.end(), [](const RecordingInfo& a, const RecordingInfo& b) {
        return a.id < b.id;
    });
    return recordings;
}

LoadedScript RecordingStore::load(const std::string& idOrPath, const std::string& fallbackLocations) const {
    if (hasRecording(idOrPath)) {
        std::string folder = folderFor(idOrPath);
        LoadedScript loaded = loadScriptFile(joinPath(folder, SCRIPT_FILE_NAME),
                                             joinPath(folder, LOCATIONS_FILE_NAME));
        std::string infoPath = joinPath(folder, INFO_FILE_NAME);
        std::error_code ec;
        if (fs::exists(infoPath, ec)) {
            try {
                loaded.info = infoFromJson(readFile(infoPath));
            } catch (const std::exception& e) {
                std::cerr << "[WARN] Unreadable " << infoPath << ": " << e.what() << std::endl;
            }
        }
        return loaded;
    }

    std::error_code ec;
    if (fs::is_regular_file(idOrPath, ec)) {
        return loadScriptFile(idOrPath, fallbackLocations);
    }

    throw std::runtime_error("Recording '" + idOrPath + "' not found");
}

void RecordingStore::writeRemapped(const std::string& sourceFolder, const std::string& targetFolder,
                                   LocationTable& locations) const {
    std::string targetScript = joinPath(targetFolder, SCRIPT_FILE_NAME);
    std::error_code ec;
    if (fs::exists(targetScript, ec)) {
        throw std::runtime_error(targetScript + " already exists");
    }

    std::string script = readFile(joinPath(sourceFolder, SCRIPT_FILE_NAME));
    std::string infoPath = joinPath(sourceFolder, INFO_FILE_NAME);
    std::optional<std::string> info;
    if (fs::exists(infoPath, ec)) {
        info = readFile(infoPath);
    }

    locations.save(joinPath(targetFolder, LOCATIONS_FILE_NAME));
    writeFileAtomic(targetScript, script);
    if (info) {
        writeFileAtomic(joinPath(targetFolder, INFO_FILE_NAME), *info);
    }
}

std::string formatRecordingScript(const std::string& id, const RecordingResult& result,
                                  const std::string& recordedAt) {
    std::ostringstream out;
    out << "# Recording ID: " << id << "\n";
    out << "# Recorded: " << recordedAt << "\n";
    out << "# Duration: " << std::fixed << std::setprecision(1) << result.durationSeconds << " seconds\n";
    out << "# Total commands: " << result.script.size() << "\n";
    out << "# New locations saved: " << result.newLocations << "\n";
    out << "\n";
    out << "# To run this recording:\n";
    out << "# simonsays play " << id << "\n";
    out << "\n";
    out << formatScript(result.script);
    return out.str();
}

LoadedScript loadScriptFile(const std::string& scriptPath, const std::string& locationsPath) {
    LoadedScript loaded;
    loaded.scriptPath = scriptPath;
    loaded.locationsPath = locationsPath;

    ParseResult parsed = parseScript(readFile(scriptPath));
    loaded.script = std::move(parsed.script);
    loaded.diagnostics = std::move(parsed.diagnostics);

    loaded.locationsLoaded = loaded.locations.load(locationsPath);
    return loaded;
}

} // namespace SimonSays
