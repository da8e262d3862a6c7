#pragma once

#include <string>
#include <cstdint>

namespace SimonSays {

constexpr const char* VERSION = "1.0.0";

// Storage
constexpr const char* DEFAULT_RECORDINGS_DIR = "recordings";
constexpr const char* DEFAULT_LOCATIONS_FILE = "locations.json";
constexpr const char* SCRIPT_FILE_NAME = "script.txt";
constexpr const char* LOCATIONS_FILE_NAME = "locations.json";
constexpr const char* INFO_FILE_NAME = "info.json";

// Location matching
constexpr double LOCATION_MATCH_THRESHOLD = 20.0;  // pixels
constexpr const char* LOCATION_NAME_PREFIX = "click_";

// Recording
constexpr double IDLE_GAP_SECONDS = 0.5;
constexpr double HOLD_THRESHOLD_SECONDS = 0.5;
constexpr double UI_SETTLE_WAIT_SECONDS = 0.25;  // after clicks and return
constexpr int TRIGGER_BUTTON = 2;                // middle mouse button

// Playback (seconds)
constexpr double DEFAULT_COMMAND_DELAY = 0.1;
constexpr double MOVE_DURATION = 0.3;
constexpr double DRAG_MOVE_DURATION = 0.5;
constexpr int MOVE_MIN_STEPS = 10;
constexpr int MOVE_MAX_STEPS = 30;
constexpr double MOVE_STEP_PIXELS = 10.0;
constexpr double SETTLE_AFTER_MOVE = 0.2;
constexpr double CLICK_HOLD = 0.1;
constexpr double SETTLE_AFTER_CLICK = 0.3;
constexpr double DEFAULT_HOLD_DURATION = 1.0;
constexpr double KEY_GAP = 0.02;
constexpr double MODIFIER_GAP = 0.01;
constexpr double CHAR_GAP = 0.02;
constexpr double PASTE_GAP = 0.05;
constexpr int COUNTDOWN_SECONDS = 3;

// Start trigger for playback: F1
constexpr int START_TRIGGER_KEY = 0x70;

// Remap confirmation buttons
constexpr int REMAP_ADOPT_BUTTON = 0;  // left click takes the clicked point
constexpr int REMAP_KEEP_BUTTON = 2;   // middle click keeps the original point

// Remap marker overlay
constexpr int MARKER_SIZE = 24;          // pixels
constexpr uint8_t MARKER_ALPHA = 180;

// Script keywords
namespace Keyword {
    constexpr const char* MOVE = "move";
    constexpr const char* CLICK = "click";
    constexpr const char* DRAG = "drag";
    constexpr const char* PRESS = "press";
    constexpr const char* TYPE = "type";
    constexpr const char* WAIT = "wait";
    constexpr const char* SLEEP = "sleep";
    constexpr const char* CODE_FENCE = "```";
}

} // namespace SimonSays
