#pragma once

#include "core/input_event.hpp"
#include "config.hpp"

#include <map>
#include <optional>
#include <string>

namespace SimonSays {

/**
 * Named screen points used by click, move and drag commands.
 *
 * Names are unique keys. Iteration is in name order, which also makes the
 * nearest-match tie-break deterministic: among equally close locations the
 * lexically smallest name wins.
 *
 * The table is a working copy of a locations.json file. It is mutated only
 * by registerNew() and set(); both mark it dirty.
 */
class LocationTable {
public:
    LocationTable() = default;

    // Replace the contents with a locations file. A missing or unreadable
    // file leaves the table empty and returns false.
    bool load(const std::string& path);

    // Write the table as JSON and clear the dirty flag. Throws on I/O errors.
    void save(const std::string& path);

    // Parse / produce the JSON form: {"name": {"x": int, "y": int}, ...}
    // parseJson throws std::runtime_error on malformed input.
    static LocationTable parseJson(const std::string& text);
    std::string toJson() const;

    // Closest location strictly within threshold pixels, if any
    std::optional<std::string> findNearest(int x, int y,
                                           double threshold = LOCATION_MATCH_THRESHOLD) const;

    // Store a point under a fresh click_<n> name and return the name
    std::string registerNew(int x, int y);

    // findNearest, falling back to registerNew. created reports which.
    std::string resolve(int x, int y, bool& created);

    // Insert or overwrite a named point
    void set(const std::string& name, Point point);

    std::optional<Point> find(const std::string& name) const;
    bool contains(const std::string& name) const { return m_locations.count(name) > 0; }

    const std::map<std::string, Point>& entries() const { return m_locations; }
    size_t size() const { return m_locations.size(); }
    bool empty() const { return m_locations.empty(); }

    bool isDirty() const { return m_dirty; }

    // Restart auto-naming at click_1 (names already taken are still skipped)
    void resetNaming() { m_nameCounter = 1; }

private:
    std::map<std::string, Point> m_locations;
    int m_nameCounter = 1;
    bool m_dirty = false;
};

// "(x, y)" or "x,y" with optional spaces and sign
std::optional<Point> parsePointLiteral(const std::string& text);

// A move target: a location name first, then a point literal
std::optional<Point> resolveTarget(const LocationTable& table, const std::string& target);

} // namespace SimonSays
