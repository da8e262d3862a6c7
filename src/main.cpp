#include "config.hpp"
#include "core/script_codec.hpp"
#include "recorder/recording_store.hpp"
#include "recorder/script_recorder.hpp"
#include "player/script_player.hpp"
#include "remap/remapper.hpp"
#include "platform/input_hook.hpp"
#include "platform/input_replay.hpp"
#include "platform/overlay_window.hpp"
#include "utils/event_channel.hpp"
#include "utils/strings.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace SimonSays;
namespace fs = std::filesystem;

std::atomic<bool> g_running{true};
std::atomic<ScriptPlayer*> g_player{nullptr};
std::atomic<ConfirmationChannel*> g_confirmations{nullptr};

struct CliOptions {
    std::string command;
    std::vector<std::string> positional;
    std::string locationsFile = DEFAULT_LOCATIONS_FILE;
    std::string recordingsDir = DEFAULT_RECORDINGS_DIR;
    double delay = DEFAULT_COMMAND_DELAY;
    bool countdown = false;
};

void printHeader() {
    std::cout << "\n";
    std::cout << "  SIMON SAYS v" << VERSION << "\n";
    std::cout << "  Input Recording and Playback for Windows\n";
    std::cout << "  ─────────────────────────────\n";
    std::cout << "\n";
}

void printUsage() {
    std::cout << "Usage:\n";
    std::cout << "  simonsays record [--locations <file>] [--dir <root>]\n";
    std::cout << "  simonsays play [<id|file>] [--locations <file>] [--delay <secs>] [--countdown] [--dir <root>]\n";
    std::cout << "  simonsays remap <id|folder> <target-folder> [--dir <root>]\n";
    std::cout << "  simonsays position\n";
    std::cout << "  simonsays help\n";
    std::cout << "\n";
    std::cout << "record    Middle click starts a recording, middle click again saves it.\n";
    std::cout << "play      Runs a recording or script file. Without one, reads commands from the console.\n";
    std::cout << "remap     Re-collects the locations of a recording for this screen.\n";
    std::cout << "position  Prints the coordinates of every click.\n";
}

bool parseArguments(int argc, char* argv[], CliOptions& options) {
    if (argc < 2) {
        options.command = "help";
        return true;
    }
    options.command = toLower(argv[1]);

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--locations" && hasValue) {
            options.locationsFile = argv[++i];
        } else if (arg == "--dir" && hasValue) {
            options.recordingsDir = argv[++i];
        } else if (arg == "--delay" && hasValue) {
            try {
                options.delay = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "[ERROR] Invalid --delay value: " << argv[i] << std::endl;
                return false;
            }
            if (options.delay < 0) {
                std::cerr << "[ERROR] --delay must not be negative" << std::endl;
                return false;
            }
        } else if (arg == "--countdown") {
            options.countdown = true;
        } else if (startsWith(arg, "--")) {
            std::cerr << "[ERROR] Unknown option: " << arg << std::endl;
            return false;
        } else {
            options.positional.push_back(arg);
        }
    }
    return true;
}

void printStatus(const std::string& status) {
    std::cout << status << std::endl;
}

// Problems with a command go to stderr, progress to stdout
void printPlayerStatus(const std::string& status) {
    if (startsWith(status, "Unknown") || startsWith(status, "Cannot")) {
        std::cerr << "[WARN] " << status << std::endl;
    } else {
        std::cout << status << std::endl;
    }
}

void printDiagnostics(const std::string& source, const std::vector<ParseDiagnostic>& diagnostics) {
    for (const auto& diagnostic : diagnostics) {
        std::cerr << "[WARN] " << source << ":" << diagnostic.line << ": " << diagnostic.message << std::endl;
    }
}

void printRecordings(const RecordingStore& store) {
    auto recordings = store.list();
    if (recordings.empty()) {
        std::cout << "No recordings in " << store.root() << "\n";
        return;
    }
    std::cout << "Available recordings:\n";
    for (const auto& info : recordings) {
        std::cout << "  " << info.id << " - " << info.description << "\n";
    }
}

bool installHook(InputHook& hook, InputCallback callback) {
    if (!hook.start(std::move(callback))) {
        std::cerr << "[ERROR] " << hook.lastError() << std::endl;
        return false;
    }
    return true;
}

int runRecord(const CliOptions& options) {
    LocationTable locations;
    if (locations.load(options.locationsFile)) {
        std::cout << "[INFO] Loaded " << locations.size() << " saved locations from " << options.locationsFile << "\n";
    }

    RecordingStore store(options.recordingsDir);
    ScriptRecorder recorder(locations);
    recorder.setStatusCallback(printStatus);

    EventChannel<InputEvent> events;
    std::atomic<uint64_t> dropped{0};

    InputHook hook;
    bool hooked = installHook(hook, [&events, &dropped](const InputEvent& event) {
        if (event.type == InputEventType::MouseMove) {
            return false;
        }
        if (!events.push(event)) {
            dropped++;
        }
        return ScriptRecorder::isTrigger(event);
    });
    if (!hooked) {
        return 1;
    }

    std::cout << "RECORD MODE\n";
    std::cout << "───────────────────────\n";
    std::cout << "1. Middle click to start recording\n";
    std::cout << "2. Perform your actions (clicks, typing, etc.)\n";
    std::cout << "3. Middle click again to stop and save the script\n";
    std::cout << "Press Ctrl+C to exit.\n\n";

    int exitCode = 0;
    while (g_running.load()) {
        auto event = events.pop(std::chrono::milliseconds(100));
        if (!event) {
            continue;
        }

        bool wasActive = recorder.isActive();
        recorder.handleEvent(*event);
        if (!wasActive && recorder.isActive()) {
            std::cout << "[INFO] Recording started\n";
        }

        auto finished = recorder.takeFinished();
        if (!finished) {
            continue;
        }

        if (finished->script.empty()) {
            std::cout << "[INFO] No events recorded\n";
            continue;
        }

        try {
            std::string id = store.save(*finished, locations);
            std::cout << "\nRecording saved: " << id << "\n";
            std::cout << "Folder: " << store.folderFor(id) << "\n";
            std::cout << "Commands: " << finished->script.size() << "\n";
            std::cout << "New locations: " << finished->newLocations << "\n";
            std::cout << "Duration: " << formatSeconds(finished->durationSeconds) << " seconds\n";
            std::cout << "\nTo run: simonsays play " << id << "\n\n";
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Could not save recording: " << e.what() << std::endl;
            exitCode = 1;
        }
    }

    hook.stop();
    events.close();

    if (recorder.isActive()) {
        std::cout << "\n[WARN] Recording was in progress but not saved\n";
    }
    if (dropped.load() > 0) {
        std::cerr << "[WARN] " << dropped.load() << " input events were dropped" << std::endl;
    }
    return exitCode;
}

bool waitForStart(bool countdown) {
    if (countdown) {
        for (int i = COUNTDOWN_SECONDS; i > 0 && g_running.load(); --i) {
            std::cout << "Starting in " << i << "...\n";
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        return g_running.load();
    }

    std::atomic<bool> started{false};
    InputHook hook;
    bool hooked = installHook(hook, [&started](const InputEvent& event) {
        if (event.vkCode != START_TRIGGER_KEY) {
            return false;
        }
        if (event.type == InputEventType::KeyDown) {
            started.store(true);
        }
        return event.type == InputEventType::KeyDown || event.type == InputEventType::KeyUp;
    });
    if (!hooked) {
        return false;
    }

    std::cout << "Press F1 to start playback (Ctrl+C to cancel)\n";
    while (g_running.load() && !started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // Let the F1 release arrive before unhooking
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    hook.stop();
    return started.load();
}

void printSummary(const PlaybackSummary& summary) {
    std::cout << "\n[INFO] Executed " << summary.executed << " commands";
    if (summary.skipped > 0) {
        std::cout << ", skipped " << summary.skipped;
    }
    if (summary.cancelled) {
        std::cout << " (cancelled)";
    }
    std::cout << "\n";
}

int runInteractive(const CliOptions& options) {
    LocationTable locations;
    if (!locations.load(options.locationsFile)) {
        std::cerr << "[WARN] No locations loaded from " << options.locationsFile << std::endl;
    }

    PlayerOptions playerOptions;
    playerOptions.commandDelay = options.delay;

    InputReplay sink;
    ScriptPlayer player(sink, locations, playerOptions);
    player.setStatusCallback(printPlayerStatus);
    g_player.store(&player);

    std::cout << "INTERACTIVE MODE\n";
    std::cout << "───────────────────────\n";
    std::cout << "Type commands, one per line. 'quit' to exit.\n\n";

    std::string line;
    while (g_running.load()) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        std::string command = trim(line);
        std::string lowered = toLower(command);
        if (lowered == "quit" || lowered == "exit" || lowered == "q") {
            break;
        }
        if (command.empty() || command[0] == '#') {
            continue;
        }

        std::string error;
        auto parsed = parseCommand(command, error);
        if (!parsed) {
            std::cerr << "[WARN] " << error << std::endl;
            continue;
        }
        player.execute(*parsed);
        if (player.isStopped()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::duration<double>(options.delay));
    }

    g_player.store(nullptr);
    return 0;
}

int runPlay(const CliOptions& options) {
    if (options.positional.empty()) {
        return runInteractive(options);
    }

    RecordingStore store(options.recordingsDir);
    const std::string& target = options.positional.front();

    LoadedScript loaded;
    try {
        loaded = store.load(target, options.locationsFile);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        printRecordings(store);
        return 1;
    }

    printDiagnostics(loaded.scriptPath, loaded.diagnostics);
    if (!loaded.locationsLoaded) {
        std::cerr << "[WARN] No locations loaded from " << loaded.locationsPath << std::endl;
    }

    std::cout << "PLAY MODE\n";
    std::cout << "───────────────────────\n";
    std::cout << "Script: " << loaded.scriptPath << "\n";
    if (loaded.info) {
        std::cout << "Recording: " << loaded.info->id << " - " << loaded.info->description << "\n";
    }
    std::cout << "Commands: " << loaded.script.size() << "\n";
    std::cout << "Locations: " << loaded.locations.size() << "\n\n";

    if (!waitForStart(options.countdown)) {
        std::cout << "Playback cancelled\n";
        return g_running.load() ? 1 : 0;
    }

    PlayerOptions playerOptions;
    playerOptions.commandDelay = options.delay;

    InputReplay sink;
    ScriptPlayer player(sink, loaded.locations, playerOptions);
    player.setStatusCallback(printPlayerStatus);

    g_player.store(&player);
    PlaybackSummary summary = player.run(loaded.script);
    g_player.store(nullptr);

    printSummary(summary);
    return 0;
}

std::string resolveRecordingFolder(const RecordingStore& store, const std::string& idOrFolder) {
    if (store.hasRecording(idOrFolder)) {
        return store.folderFor(idOrFolder);
    }
    return idOrFolder;
}

int runRemap(const CliOptions& options) {
    if (options.positional.size() < 2) {
        std::cerr << "[ERROR] remap needs a source recording and a target folder" << std::endl;
        printUsage();
        return 1;
    }

    RecordingStore store(options.recordingsDir);
    std::string sourceFolder = resolveRecordingFolder(store, options.positional[0]);

    // A bare name lands next to the other recordings
    std::string targetFolder = options.positional[1];
    if (!fs::path(targetFolder).has_parent_path()) {
        targetFolder = store.folderFor(targetFolder);
    }

    std::error_code ec;
    if (fs::exists(fs::path(targetFolder) / SCRIPT_FILE_NAME, ec)) {
        std::cerr << "[ERROR] " << targetFolder << " already contains a script" << std::endl;
        return 1;
    }

    LoadedScript loaded;
    try {
        loaded = loadScriptFile((fs::path(sourceFolder) / SCRIPT_FILE_NAME).string(),
                                (fs::path(sourceFolder) / LOCATIONS_FILE_NAME).string());
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        printRecordings(store);
        return 1;
    }
    printDiagnostics(loaded.scriptPath, loaded.diagnostics);
    if (!loaded.locationsLoaded) {
        std::cerr << "[WARN] No locations loaded from " << loaded.locationsPath << std::endl;
    }

    Remapper remapper(loaded.script, loaded.locations);
    remapper.setStatusCallback(printStatus);
    if (remapper.referencedNames().empty()) {
        std::cout << "[INFO] The script does not use any named locations\n";
    }

    ConfirmationChannel confirmations;
    g_confirmations.store(&confirmations);

    // Index 0 left, 2 middle. A click whose press was taken also loses its release.
    std::atomic<bool> swallowRelease[3] = {{false}, {false}, {false}};

    InputHook hook;
    bool hooked = installHook(hook, [&confirmations, &swallowRelease](const InputEvent& event) {
        if (event.button != REMAP_ADOPT_BUTTON && event.button != REMAP_KEEP_BUTTON) {
            return false;
        }
        if (event.type == InputEventType::MouseButtonUp) {
            return swallowRelease[event.button].exchange(false);
        }
        if (event.type != InputEventType::MouseButtonDown) {
            return false;
        }

        Confirmation confirmation;
        confirmation.kind = event.button == REMAP_ADOPT_BUTTON ? ConfirmationKind::Adopt
                                                               : ConfirmationKind::KeepOriginal;
        confirmation.point = Point{event.x, event.y};
        bool accepted = confirmations.offer(confirmation);
        swallowRelease[event.button].store(accepted);
        return accepted;
    });
    if (!hooked) {
        g_confirmations.store(nullptr);
        return 1;
    }

    std::cout << "REMAP MODE\n";
    std::cout << "───────────────────────\n";
    std::cout << "For each location the old position is marked in red.\n";
    std::cout << "Left click the new position, or middle click to keep the old one.\n";
    std::cout << "Press Ctrl+C to cancel.\n\n";

    std::optional<LocationTable> remapped;
    {
        OverlayWindow marker;
        remapped = remapper.run(confirmations, marker);
    }

    hook.stop();
    g_confirmations.store(nullptr);

    if (!remapped) {
        std::cout << "Remap cancelled, nothing written\n";
        return 0;
    }

    try {
        store.writeRemapped(sourceFolder, targetFolder, *remapped);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nRemapped recording written to " << targetFolder << "\n";
    return 0;
}

int runPosition() {
    InputHook hook;
    bool hooked = installHook(hook, [](const InputEvent& event) {
        if (event.type == InputEventType::MouseButtonDown && (event.button == 0 || event.button == 1)) {
            std::cout << (event.button == 0 ? "Left" : "Right") << " click at (" << event.x << ", " << event.y << ")" << std::endl;
        }
        return false;
    });
    if (!hooked) {
        return 1;
    }

    std::cout << "POSITION MODE\n";
    std::cout << "───────────────────────\n";
    std::cout << "Click anywhere to print its coordinates. Press Ctrl+C to exit.\n\n";

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    hook.stop();
    return 0;
}

BOOL WINAPI ConsoleHandler(DWORD signal) {
    if (signal == CTRL_C_EVENT || signal == CTRL_CLOSE_EVENT) {
        g_running.store(false);
        if (ScriptPlayer* player = g_player.load()) {
            player->stop();
        }
        if (ConfirmationChannel* confirmations = g_confirmations.load()) {
            confirmations->close();
        }
        return TRUE;
    }
    return FALSE;
}

int main(int argc, char* argv[]) {
    // Setup console handling
    SetConsoleCtrlHandler(ConsoleHandler, TRUE);
    SetConsoleOutputCP(CP_UTF8);

    // Match cursor coordinates to physical pixels on scaled displays
    SetProcessDPIAware();

    CliOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage();
        return 1;
    }

    printHeader();

    if (options.command == "record") {
        return runRecord(options);
    }
    if (options.command == "play") {
        return runPlay(options);
    }
    if (options.command == "remap") {
        return runRemap(options);
    }
    if (options.command == "position") {
        return runPosition();
    }
    if (options.command == "help" || options.command == "--help" || options.command == "-h") {
        printUsage();
        return 0;
    }

    std::cerr << "[ERROR] Unknown command: " << options.command << std::endl;
    printUsage();
    return 1;
}
