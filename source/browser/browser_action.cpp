#include "browser/browser_action.hpp"

#include <utility>

namespace browser_action {

static const std::pair<ActionType, const char *> ACTION_NAMES[] = {
    {ActionType::Screenshot, "screenshot"},
    {ActionType::LeftClick, "left_click"},
    {ActionType::RightClick, "right_click"},
    {ActionType::MiddleClick, "middle_click"},
    {ActionType::DoubleClick, "double_click"},
    {ActionType::TripleClick, "triple_click"},
    {ActionType::MouseMove, "mouse_move"},
    {ActionType::LeftMouseDown, "left_mouse_down"},
    {ActionType::LeftMouseUp, "left_mouse_up"},
    {ActionType::LeftClickDrag, "left_click_drag"},
    {ActionType::Type, "type"},
    {ActionType::Key, "key"},
    {ActionType::Scroll, "scroll"},
    {ActionType::HoldKey, "hold_key"},
    {ActionType::Wait, "wait"},
    {ActionType::Navigate, "navigate"},
    {ActionType::Zoom, "zoom"},
};

std::string action_type_name(ActionType type) {
    for (const auto &entry : ACTION_NAMES) {
        if (entry.first == type) {
            return entry.second;
        }
    }
    return "unknown";
}

bool parse_action_type(const std::string &name, ActionType &out_type) {
    for (const auto &entry : ACTION_NAMES) {
        if (name == entry.second) {
            out_type = entry.first;
            return true;
        }
    }
    return false;
}

std::string scroll_direction_name(ScrollDirection direction) {
    switch (direction) {
    case ScrollDirection::Up:
        return "up";
    case ScrollDirection::Down:
        return "down";
    case ScrollDirection::Left:
        return "left";
    case ScrollDirection::Right:
        return "right";
    }
    return "down";
}

bool parse_scroll_direction(const std::string &name, ScrollDirection &out_direction) {
    if (name == "up") {
        out_direction = ScrollDirection::Up;
    } else if (name == "down") {
        out_direction = ScrollDirection::Down;
    } else if (name == "left") {
        out_direction = ScrollDirection::Left;
    } else if (name == "right") {
        out_direction = ScrollDirection::Right;
    } else {
        return false;
    }
    return true;
}

bool is_non_visual(const BrowserAction &action) {
    return action.type == ActionType::Wait || action.type == ActionType::Screenshot;
}

} // namespace browser_action
