#include "location_table.hpp"
#include "utils/file_io.hpp"
#include "utils/strings.hpp"

#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace SimonSays {

bool LocationTable::load(const std::string& path) {
    m_locations.clear();
    m_nameCounter = 1;
    m_dirty = false;

    std::string text;
    try {
        text = readFile(path);
    } catch (const std::exception&) {
        return false;
    }

    try {
        *this = parseJson(text);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[WARN] Could not load locations from " << path << ": " << e.what() << std::endl;
        m_locations.clear();
        return false;
    }
}

void LocationTable::save(const std::string& path) {
    writeFileAtomic(path, toJson());
    m_dirty = false;
}

LocationTable LocationTable::parseJson(const std::string& text) {
    LocationTable table;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw std::runtime_error("locations file must hold a JSON object");
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            Point point;
            point.x = it.value().at("x").get<int>();
            point.y = it.value().at("y").get<int>();
            table.m_locations[it.key()] = point;
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(e.what());
    }
    return table;
}

std::string LocationTable::toJson() const {
    json j = json::object();
    for (const auto& [name, point] : m_locations) {
        j[name] = {{"x", point.x}, {"y", point.y}};
    }
    return j.dump(2) + "\n";
}

std::optional<std::string> LocationTable::findNearest(int x, int y, double threshold) const {
    std::optional<std::string> nearestName;
    double nearestDistance = std::numeric_limits<double>::infinity();

    for (const auto& [name, point] : m_locations) {
        double dx = static_cast<double>(x - point.x);
        double dy = static_cast<double>(y - point.y);
        double distance = std::sqrt(dx * dx + dy * dy);
        if (distance < threshold && distance < nearestDistance) {
            nearestDistance = distance;
            nearestName = name;
        }
    }

    return nearestName;
}

std::string LocationTable::registerNew(int x, int y) {
    std::string name;
    while (true) {
        name = LOCATION_NAME_PREFIX + std::to_string(m_nameCounter);
        if (!contains(name)) {
            break;
        }
        m_nameCounter++;
    }

    m_locations[name] = Point{x, y};
    m_dirty = true;
    m_nameCounter++;
    return name;
}

std::string LocationTable::resolve(int x, int y, bool& created) {
    if (auto existing = findNearest(x, y)) {
        created = false;
        return *existing;
    }
    created = true;
    return registerNew(x, y);
}

void LocationTable::set(const std::string& name, Point point) {
    m_locations[name] = point;
    m_dirty = true;
}

std::optional<Point> LocationTable::find(const std::string& name) const {
    auto it = m_locations.find(name);
    if (it == m_locations.end()) {
        return std::nullopt;
    }
    return it->second;
}

namespace {

// Parse an optionally signed integer at pos, skipping leading spaces
bool readInt(const std::string& text, size_t& pos, int& value) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) pos++;
    size_t start = pos;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) pos++;
    size_t digits = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) pos++;
    if (pos == digits) {
        return false;
    }
    try {
        value = std::stoi(text.substr(start, pos - start));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

} // namespace

std::optional<Point> parsePointLiteral(const std::string& text) {
    std::string body = trim(text);
    bool parenthesized = !body.empty() && body.front() == '(';
    if (parenthesized) {
        if (body.back() != ')') {
            return std::nullopt;
        }
        body = body.substr(1, body.size() - 2);
    }

    size_t pos = 0;
    Point point;
    if (!readInt(body, pos, point.x)) {
        return std::nullopt;
    }
    while (pos < body.size() && std::isspace(static_cast<unsigned char>(body[pos]))) pos++;
    if (pos >= body.size() || body[pos] != ',') {
        return std::nullopt;
    }
    pos++;
    if (!readInt(body, pos, point.y)) {
        return std::nullopt;
    }
    while (pos < body.size() && std::isspace(static_cast<unsigned char>(body[pos]))) pos++;
    if (pos != body.size()) {
        return std::nullopt;
    }
    return point;
}

std::optional<Point> resolveTarget(const LocationTable& table, const std::string& target) {
    if (auto point = table.find(target)) {
        return point;
    }
    return parsePointLiteral(target);
}

} // namespace SimonSays
