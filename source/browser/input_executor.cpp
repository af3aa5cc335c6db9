#include "browser/input_executor.hpp"
#include "browser/cdp/cdp_driver.hpp"
#include "frames/frame_types.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <thread>

namespace input_executor {

using browser_action::ActionType;
using browser_action::BrowserAction;
using browser_action::Coordinate;
using browser_driver::DriverResult;

static KeyDefinition named_key(const std::string &key, const std::string &code, int virtual_key_code,
                               const std::string &text = "", int modifier_bit = 0) {
    KeyDefinition definition;
    definition.key = key;
    definition.code = code;
    definition.windows_virtual_key_code = virtual_key_code;
    definition.text = text;
    definition.modifier_bit = modifier_bit;
    return definition;
}

// Lower-case alias -> key.
static const std::map<std::string, KeyDefinition> &key_table() {
    static const std::map<std::string, KeyDefinition> table = []() {
        std::map<std::string, KeyDefinition> keys;
        KeyDefinition enter = named_key("Enter", "Enter", 13, "\r");
        keys["return"] = enter;
        keys["enter"] = enter;
        keys["tab"] = named_key("Tab", "Tab", 9);
        KeyDefinition escape = named_key("Escape", "Escape", 27);
        keys["escape"] = escape;
        keys["esc"] = escape;
        keys["backspace"] = named_key("Backspace", "Backspace", 8);
        keys["delete"] = named_key("Delete", "Delete", 46);
        keys["insert"] = named_key("Insert", "Insert", 45);
        keys["space"] = named_key(" ", "Space", 32, " ");
        KeyDefinition arrow_up = named_key("ArrowUp", "ArrowUp", 38);
        KeyDefinition arrow_down = named_key("ArrowDown", "ArrowDown", 40);
        KeyDefinition arrow_left = named_key("ArrowLeft", "ArrowLeft", 37);
        KeyDefinition arrow_right = named_key("ArrowRight", "ArrowRight", 39);
        keys["up"] = arrow_up;
        keys["arrowup"] = arrow_up;
        keys["down"] = arrow_down;
        keys["arrowdown"] = arrow_down;
        keys["left"] = arrow_left;
        keys["arrowleft"] = arrow_left;
        keys["right"] = arrow_right;
        keys["arrowright"] = arrow_right;
        keys["home"] = named_key("Home", "Home", 36);
        keys["end"] = named_key("End", "End", 35);
        keys["pageup"] = named_key("PageUp", "PageUp", 33);
        keys["page_up"] = keys["pageup"];
        keys["pagedown"] = named_key("PageDown", "PageDown", 34);
        keys["page_down"] = keys["pagedown"];
        for (int function_number = 1; function_number <= 12; function_number++) {
            std::string name = "F" + std::to_string(function_number);
            keys["f" + std::to_string(function_number)] = named_key(name, name, 111 + function_number);
        }

        KeyDefinition control = named_key("Control", "ControlLeft", 17, "", browser_driver::MODIFIER_CTRL);
        KeyDefinition alt = named_key("Alt", "AltLeft", 18, "", browser_driver::MODIFIER_ALT);
        KeyDefinition shift = named_key("Shift", "ShiftLeft", 16, "", browser_driver::MODIFIER_SHIFT);
        KeyDefinition meta = named_key("Meta", "MetaLeft", 91, "", browser_driver::MODIFIER_META);
        keys["ctrl"] = control;
        keys["control"] = control;
        keys["alt"] = alt;
        keys["option"] = alt;
        keys["shift"] = shift;
        keys["meta"] = meta;
        keys["super"] = meta;
        keys["cmd"] = meta;
        keys["command"] = meta;
        keys["win"] = meta;
        keys["windows"] = meta;
        return keys;
    }();
    return table;
}

static std::string to_lower(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return lowered;
}

static std::string trim(const std::string &text) {
    size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

bool resolve_key(const std::string &name, KeyDefinition &out_key) {
    if (name.empty()) {
        return false;
    }
    const auto &table = key_table();
    auto found = table.find(to_lower(name));
    if (found != table.end()) {
        out_key = found->second;
        return true;
    }
    if (name.size() != 1) {
        return false;
    }

    unsigned char character = static_cast<unsigned char>(name[0]);
    if (!std::isprint(character)) {
        return false;
    }
    out_key = KeyDefinition();
    out_key.key = name;
    out_key.text = name;
    if (std::isalpha(character)) {
        char upper = static_cast<char>(std::toupper(character));
        out_key.code = std::string("Key") + upper;
        out_key.windows_virtual_key_code = upper;
    } else if (std::isdigit(character)) {
        out_key.code = std::string("Digit") + name;
        out_key.windows_virtual_key_code = character;
    }
    return true;
}

bool parse_key_combination(const std::string &text, KeyCombination &out_combination, std::string &error_detail) {
    out_combination = KeyCombination();
    std::string remaining = trim(text);
    if (remaining.empty()) {
        error_detail = "key combination is empty";
        return false;
    }

    std::vector<std::string> parts;
    if (remaining == "+") {
        parts.push_back("+");
    } else {
        size_t start = 0;
        while (start <= remaining.size()) {
            size_t plus = remaining.find('+', start);
            if (plus == std::string::npos) {
                parts.push_back(trim(remaining.substr(start)));
                break;
            }
            parts.push_back(trim(remaining.substr(start, plus - start)));
            start = plus + 1;
        }
        // "ctrl++" splits into "ctrl", "", "": the trailing empties are the plus key.
        if (parts.size() >= 2 && parts[parts.size() - 1].empty() && parts[parts.size() - 2].empty()) {
            parts.pop_back();
            parts.back() = "+";
        }
    }

    for (const std::string &part : parts) {
        KeyDefinition key;
        if (!resolve_key(part, key)) {
            error_detail = "unknown key '" + part + "' in '" + text + "'";
            return false;
        }
        if (key.modifier_bit != 0) {
            out_combination.modifiers.push_back(key);
            continue;
        }
        if (out_combination.has_main_key) {
            error_detail = "more than one non-modifier key in '" + text + "'";
            return false;
        }
        out_combination.main_key = key;
        out_combination.has_main_key = true;
    }
    return true;
}

int modifier_mask(const std::string &modifier_name) {
    if (modifier_name.empty()) {
        return 0;
    }
    KeyDefinition key;
    if (!resolve_key(modifier_name, key)) {
        return 0;
    }
    return key.modifier_bit;
}

ScrollDelta scroll_delta(browser_action::ScrollDirection direction, int amount, const std::string &modifier) {
    ScrollDelta delta;
    const double pixels = amount * SCROLL_PIXELS_PER_UNIT;
    const bool horizontal = to_lower(modifier) == "shift";
    switch (direction) {
    case browser_action::ScrollDirection::Up:
        (horizontal ? delta.delta_x : delta.delta_y) = -pixels;
        break;
    case browser_action::ScrollDirection::Down:
        (horizontal ? delta.delta_x : delta.delta_y) = pixels;
        break;
    case browser_action::ScrollDirection::Left:
        delta.delta_x = -pixels;
        break;
    case browser_action::ScrollDirection::Right:
        delta.delta_x = pixels;
        break;
    }
    return delta;
}

std::vector<Coordinate> drag_path(const Coordinate &start, const Coordinate &end, int steps) {
    std::vector<Coordinate> path;
    if (steps < 1) {
        steps = 1;
    }
    for (int step = 1; step <= steps; step++) {
        Coordinate point;
        point.x = start.x + (end.x - start.x) * step / steps;
        point.y = start.y + (end.y - start.y) * step / steps;
        path.push_back(point);
    }
    return path;
}

InputBackend cdp_input_backend() {
    InputBackend backend;
    backend.dispatch_mouse_event = cdp_driver::dispatch_mouse_event;
    backend.dispatch_key_event = cdp_driver::dispatch_key_event;
    backend.insert_text = cdp_driver::insert_text;
    backend.navigate = cdp_driver::navigate;
    backend.capture_screenshot = cdp_driver::capture_screenshot;
    backend.sleep = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    return backend;
}

InputExecutor::InputExecutor(InputBackend backend) : backend(std::move(backend)) {}

void InputExecutor::sleep_seconds(double seconds) {
    if (seconds > 0 && backend.sleep) {
        backend.sleep(std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0)));
    }
}

DriverResult InputExecutor::mouse_move(const Coordinate &coordinate, const std::string &button) {
    browser_driver::MouseEvent event;
    event.type = "mouseMoved";
    event.x = coordinate.x;
    event.y = coordinate.y;
    event.button = button;
    return backend.dispatch_mouse_event(event);
}

DriverResult InputExecutor::mouse_button(const std::string &type, const Coordinate &coordinate,
                                         const std::string &button, int click_count, int modifiers) {
    browser_driver::MouseEvent event;
    event.type = type;
    event.x = coordinate.x;
    event.y = coordinate.y;
    event.button = button;
    event.click_count = click_count;
    event.modifiers = modifiers;
    return backend.dispatch_mouse_event(event);
}

DriverResult InputExecutor::key_down(const KeyDefinition &key, int modifiers) {
    browser_driver::KeyEvent event;
    event.type = key.text.empty() ? "rawKeyDown" : "keyDown";
    event.key = key.key;
    event.code = key.code;
    event.text = key.text;
    event.windows_virtual_key_code = key.windows_virtual_key_code;
    event.modifiers = modifiers;
    return backend.dispatch_key_event(event);
}

DriverResult InputExecutor::key_up(const KeyDefinition &key, int modifiers) {
    browser_driver::KeyEvent event;
    event.type = "keyUp";
    event.key = key.key;
    event.code = key.code;
    event.windows_virtual_key_code = key.windows_virtual_key_code;
    event.modifiers = modifiers;
    return backend.dispatch_key_event(event);
}

DriverResult InputExecutor::click(const BrowserAction &action) {
    std::string button = "left";
    int click_count = 1;
    switch (action.type) {
    case ActionType::RightClick:
        button = "right";
        break;
    case ActionType::MiddleClick:
        button = "middle";
        break;
    case ActionType::DoubleClick:
        click_count = 2;
        break;
    case ActionType::TripleClick:
        click_count = 3;
        break;
    default:
        break;
    }

    KeyDefinition modifier_key;
    bool hold_modifier = !action.text.empty();
    if (hold_modifier && (!resolve_key(action.text, modifier_key) || modifier_key.modifier_bit == 0)) {
        DriverResult result;
        result.error_detail = "unknown click modifier '" + action.text + "'";
        return result;
    }
    int modifiers = hold_modifier ? modifier_key.modifier_bit : 0;

    if (hold_modifier) {
        DriverResult down_result = key_down(modifier_key, modifiers);
        if (!down_result.success) {
            return down_result;
        }
    }

    DriverResult result = mouse_move(action.coordinate, "none");
    for (int click = 1; click <= click_count && result.success; click++) {
        result = mouse_button("mousePressed", action.coordinate, button, click, modifiers);
        if (result.success) {
            result = mouse_button("mouseReleased", action.coordinate, button, click, modifiers);
        }
    }

    // Release the modifier even when the click failed.
    if (hold_modifier) {
        DriverResult up_result = key_up(modifier_key, 0);
        if (result.success && !up_result.success) {
            result = up_result;
        }
    }
    return result;
}

DriverResult InputExecutor::drag(const Coordinate &start, const Coordinate &end) {
    DriverResult result = mouse_move(start, "none");
    if (!result.success) {
        return result;
    }
    result = mouse_button("mousePressed", start, "left", 1, 0);
    if (!result.success) {
        return result;
    }
    for (const Coordinate &point : drag_path(start, end, DRAG_STEPS)) {
        result = mouse_move(point, "left");
        if (!result.success) {
            break;
        }
        if (backend.sleep) {
            backend.sleep(std::chrono::milliseconds(10));
        }
    }
    DriverResult release = mouse_button("mouseReleased", end, "left", 1, 0);
    return result.success ? release : result;
}

DriverResult InputExecutor::type_text(const std::string &text) {
    // insertText does not turn newlines into Enter presses.
    KeyDefinition enter;
    resolve_key("enter", enter);
    size_t start = 0;
    while (start <= text.size()) {
        size_t newline = text.find('\n', start);
        std::string segment = text.substr(start, newline == std::string::npos ? std::string::npos : newline - start);
        if (!segment.empty()) {
            DriverResult result = backend.insert_text(segment);
            if (!result.success) {
                return result;
            }
        }
        if (newline == std::string::npos) {
            break;
        }
        DriverResult result = key_down(enter, 0);
        if (result.success) {
            result = key_up(enter, 0);
        }
        if (!result.success) {
            return result;
        }
        start = newline + 1;
    }
    DriverResult result;
    result.success = true;
    return result;
}

DriverResult InputExecutor::press_combination(const std::string &text) {
    DriverResult result;
    KeyCombination combination;
    if (!parse_key_combination(text, combination, result.error_detail)) {
        return result;
    }

    int modifiers = 0;
    size_t pressed_modifiers = 0;
    result.success = true;
    for (const KeyDefinition &modifier : combination.modifiers) {
        modifiers |= modifier.modifier_bit;
        result = key_down(modifier, modifiers);
        if (!result.success) {
            break;
        }
        pressed_modifiers++;
    }

    if (result.success && combination.has_main_key) {
        KeyDefinition main_key = combination.main_key;
        // Shortcuts must not type their letter; shift alone upper-cases it.
        if (modifiers & (browser_driver::MODIFIER_CTRL | browser_driver::MODIFIER_ALT | browser_driver::MODIFIER_META)) {
            main_key.text.clear();
        } else if ((modifiers & browser_driver::MODIFIER_SHIFT) && main_key.text.size() == 1 &&
                   std::isalpha(static_cast<unsigned char>(main_key.text[0]))) {
            main_key.text = std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(main_key.text[0]))));
            main_key.key = main_key.text;
        }
        result = key_down(main_key, modifiers);
        if (result.success) {
            result = key_up(main_key, modifiers);
        }
    }

    // Release in reverse order, even after a failure.
    for (size_t index = pressed_modifiers; index > 0; index--) {
        const KeyDefinition &modifier = combination.modifiers[index - 1];
        modifiers &= ~modifier.modifier_bit;
        DriverResult up_result = key_up(modifier, modifiers);
        if (result.success && !up_result.success) {
            result = up_result;
        }
    }
    return result;
}

DriverResult InputExecutor::scroll(const BrowserAction &action) {
    DriverResult result = mouse_move(action.coordinate, "none");
    if (!result.success) {
        return result;
    }
    ScrollDelta delta = scroll_delta(action.scroll_direction, action.scroll_amount, action.text);
    browser_driver::MouseEvent wheel;
    wheel.type = "mouseWheel";
    wheel.x = action.coordinate.x;
    wheel.y = action.coordinate.y;
    wheel.delta_x = delta.delta_x;
    wheel.delta_y = delta.delta_y;
    result = backend.dispatch_mouse_event(wheel);
    if (result.success && backend.sleep) {
        backend.sleep(std::chrono::milliseconds(100));
    }
    return result;
}

DriverResult InputExecutor::hold_key(const std::string &key_name, double duration_seconds) {
    DriverResult result;
    KeyDefinition key;
    if (!resolve_key(key_name, key)) {
        result.error_detail = "unknown key '" + key_name + "'";
        return result;
    }
    result = key_down(key, key.modifier_bit);
    if (!result.success) {
        return result;
    }
    sleep_seconds(duration_seconds);
    return key_up(key, 0);
}

browser_action::ActionResult InputExecutor::execute(const BrowserAction &action) {
    std::lock_guard<std::mutex> lock(execute_mutex);
    browser_action::ActionResult action_result;
    DriverResult result;
    result.success = true;

    switch (action.type) {
    case ActionType::Screenshot: {
        browser_driver::CaptureScreenshotOptions options;
        browser_driver::CaptureScreenshotResult screenshot = backend.capture_screenshot(options);
        result.success = screenshot.success;
        result.error_detail = screenshot.error_detail;
        action_result.screenshot_base64 = screenshot.image_base64;
        action_result.screenshot_mime_type = screenshot.mime_type;
        break;
    }
    case ActionType::LeftClick:
    case ActionType::RightClick:
    case ActionType::MiddleClick:
    case ActionType::DoubleClick:
    case ActionType::TripleClick:
        result = click(action);
        break;
    case ActionType::MouseMove:
        result = mouse_move(action.coordinate, "none");
        break;
    case ActionType::LeftMouseDown:
        result = mouse_move(action.coordinate, "none");
        if (result.success) {
            result = mouse_button("mousePressed", action.coordinate, "left", 1, 0);
        }
        break;
    case ActionType::LeftMouseUp:
        result = mouse_move(action.coordinate, "left");
        if (result.success) {
            result = mouse_button("mouseReleased", action.coordinate, "left", 1, 0);
        }
        break;
    case ActionType::LeftClickDrag:
        result = drag(action.start_coordinate, action.end_coordinate);
        break;
    case ActionType::Type:
        if (action.text.empty()) {
            result.success = false;
            result.error_detail = "type requires text";
        } else {
            result = type_text(action.text);
        }
        break;
    case ActionType::Key:
        result = press_combination(action.text);
        break;
    case ActionType::Scroll:
        if (action.scroll_amount <= 0) {
            result.success = false;
            result.error_detail = "scroll_amount must be positive";
        } else {
            result = scroll(action);
        }
        break;
    case ActionType::HoldKey:
        result = hold_key(action.key, action.duration_seconds);
        break;
    case ActionType::Wait:
        sleep_seconds(action.duration_seconds);
        break;
    case ActionType::Navigate: {
        browser_driver::NavigateResult navigation = backend.navigate(action.url);
        result.success = navigation.success;
        result.error_detail = navigation.error_text;
        break;
    }
    case ActionType::Zoom:
        // Region zoom is a viewing concern of the consumer; nothing to send.
        break;
    }

    action_result.success = result.success;
    action_result.error_detail = result.error_detail;
    action_result.completed_at_ms = frames::now_epoch_ms();
    if (!result.success) {
        debug_log::log("input: " + browser_action::action_type_name(action.type) + " failed: " + result.error_detail);
    }
    return action_result;
}

} // namespace input_executor
