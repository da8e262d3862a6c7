#include "command.hpp"
#include "location_table.hpp"
#include "utils/strings.hpp"

namespace SimonSays {

std::string buttonName(MouseButton button) {
    return button == MouseButton::Left ? "left" : "right";
}

std::optional<MouseButton> parseButton(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "left") return MouseButton::Left;
    if (lower == "right") return MouseButton::Right;
    return std::nullopt;
}

std::optional<MouseButton> buttonFromIndex(int index) {
    switch (index) {
        case 0: return MouseButton::Left;
        case 1: return MouseButton::Right;
        default: return std::nullopt;
    }
}

std::vector<std::string> referencedLocations(const Command& command) {
    std::vector<std::string> names;

    if (const auto* move = std::get_if<MoveTo>(&command)) {
        if (!parsePointLiteral(move->target)) {
            names.push_back(move->target);
        }
    } else if (const auto* click = std::get_if<Click>(&command)) {
        if (click->location) names.push_back(*click->location);
    } else if (const auto* hold = std::get_if<ClickAndHold>(&command)) {
        if (hold->location) names.push_back(*hold->location);
    } else if (const auto* drag = std::get_if<Drag>(&command)) {
        names.push_back(drag->from);
        names.push_back(drag->to);
    }

    return names;
}

bool isComment(const Command& command) {
    return std::holds_alternative<Comment>(command);
}

} // namespace SimonSays
