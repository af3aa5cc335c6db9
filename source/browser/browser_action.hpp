#ifndef FRAMESYNC_BROWSER_ACTION_HPP
#define FRAMESYNC_BROWSER_ACTION_HPP

// Abstract agent actions (Computer Use action vocabulary) and their results.

#include <cstdint>
#include <string>
#include <vector>

namespace browser_action {

enum class ActionType {
    Screenshot,
    LeftClick,
    RightClick,
    MiddleClick,
    DoubleClick,
    TripleClick,
    MouseMove,
    LeftMouseDown,
    LeftMouseUp,
    LeftClickDrag,
    Type,
    Key,
    Scroll,
    HoldKey,
    Wait,
    Navigate,
    Zoom
};

enum class ScrollDirection {
    Up,
    Down,
    Left,
    Right
};

struct Coordinate {
    double x = 0;
    double y = 0;
};

// Discriminated by type; only the fields the type uses are meaningful.
struct BrowserAction {
    ActionType type = ActionType::Screenshot;
    Coordinate coordinate;        // clicks, mouse_move, mouse down/up, scroll
    Coordinate start_coordinate;  // left_click_drag
    Coordinate end_coordinate;    // left_click_drag
    std::string text;             // type: text; key: combination; clicks/scroll: modifier
    std::string key;              // hold_key
    ScrollDirection scroll_direction = ScrollDirection::Down;
    int scroll_amount = 0;
    double duration_seconds = 0;  // wait, hold_key
    std::string url;              // navigate
    std::vector<double> region;   // zoom: x1, y1, x2, y2
    int64_t based_on_frame_id = 0; // frame the agent looked at, 0 = unspecified
};

// Outcome of executing one action against the surface.
struct ActionResult {
    bool success = false;
    std::string error_detail;
    std::string screenshot_base64; // screenshot action only
    std::string screenshot_mime_type;
    int64_t completed_at_ms = 0;
};

// "left_click" etc.
std::string action_type_name(ActionType type);

// Returns false for unknown names.
bool parse_action_type(const std::string &name, ActionType &out_type);

std::string scroll_direction_name(ScrollDirection direction);
bool parse_scroll_direction(const std::string &name, ScrollDirection &out_direction);

// Actions that never change the surface and need no post-action frame wait.
bool is_non_visual(const BrowserAction &action);

} // namespace browser_action

#endif // FRAMESYNC_BROWSER_ACTION_HPP
