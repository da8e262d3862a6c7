#pragma once

#include "recorder/script_recorder.hpp"
#include "core/location_table.hpp"
#include "core/script_codec.hpp"
#include "config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace SimonSays {

// Contents of info.json
struct RecordingInfo {
    std::string id;
    std::string created;      // ISO-8601 local time
    double duration = 0.0;    // seconds
    int commands = 0;
    int locations = 0;        // new locations saved while recording
    std::string description;
};

std::string infoToJson(const RecordingInfo& info);
// Throws std::runtime_error on malformed JSON
RecordingInfo infoFromJson(const std::string& text);

// A script ready to play, with the table its names refer to
struct LoadedScript {
    std::string scriptPath;
    std::string locationsPath;
    Script script;
    std::vector<ParseDiagnostic> diagnostics;
    LocationTable locations;
    bool locationsLoaded = false;
    std::optional<RecordingInfo> info;
};

/**
 * Recording folders under a root directory: <root>/rec<N>/ holding
 * script.txt, locations.json and info.json.
 */
class RecordingStore {
public:
    explicit RecordingStore(std::string root = DEFAULT_RECORDINGS_DIR);

    const std::string& root() const { return m_root; }

    // rec<highest N + 1>, rec1 when there is nothing yet
    std::string nextRecordingId() const;

    std::string folderFor(const std::string& id) const;
    bool hasRecording(const std::string& id) const;

    // Write a finished session under the next id and return the id.
    // The locations file is written when the table changed or the folder
    // has none yet. Throws std::runtime_error on I/O errors.
    std::string save(const RecordingResult& result, LocationTable& locations);

    // Same, into an explicit folder
    void saveTo(const std::string& folder, const std::string& id,
                const RecordingResult& result, LocationTable& locations);

    // All recordings with their info, sorted by id
    std::vector<RecordingInfo> list() const;

    // Resolve a play argument: a recording id under the root first, then a
    // script file path used with fallbackLocations. Throws
    // std::runtime_error when neither exists or the script is unreadable.
    LoadedScript load(const std::string& idOrPath, const std::string& fallbackLocations) const;

    // Copy script.txt and info.json from source into target and write the
    // new table there. Refuses to overwrite an existing script.
    void writeRemapped(const std::string& sourceFolder, const std::string& targetFolder,
                       LocationTable& locations) const;

private:
    std::string m_root;
};

// Header comments followed by the serialized commands
std::string formatRecordingScript(const std::string& id, const RecordingResult& result,
                                  const std::string& recordedAt);

// Load a script file and a locations file into a LoadedScript
LoadedScript loadScriptFile(const std::string& scriptPath, const std::string& locationsPath);

} // namespace SimonSays
