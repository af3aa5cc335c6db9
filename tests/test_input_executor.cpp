// Tests for translating actions into Input.* events, using a recording backend.

#include "browser/input_executor.hpp"
#include "test_support.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using test_support::check;
using browser_action::ActionType;
using browser_action::BrowserAction;

namespace test_input_executor {

// Everything the executor sent, in order.
struct RecordedInput {
    std::vector<browser_driver::MouseEvent> mouse_events;
    std::vector<browser_driver::KeyEvent> key_events;
    std::vector<std::string> inserted_text;
    std::vector<std::string> navigations;
    int64_t slept_ms = 0;
    int screenshots = 0;
    bool fail_mouse = false;
};

static browser_driver::DriverResult ok_result() {
    browser_driver::DriverResult result;
    result.success = true;
    return result;
}

static input_executor::InputBackend recording_backend(RecordedInput &recorded) {
    input_executor::InputBackend backend;
    backend.dispatch_mouse_event = [&recorded](const browser_driver::MouseEvent &event) {
        if (recorded.fail_mouse) {
            browser_driver::DriverResult failed;
            failed.error_detail = "target closed";
            return failed;
        }
        recorded.mouse_events.push_back(event);
        return ok_result();
    };
    backend.dispatch_key_event = [&recorded](const browser_driver::KeyEvent &event) {
        recorded.key_events.push_back(event);
        return ok_result();
    };
    backend.insert_text = [&recorded](const std::string &text) {
        recorded.inserted_text.push_back(text);
        return ok_result();
    };
    backend.navigate = [&recorded](const std::string &url) {
        recorded.navigations.push_back(url);
        browser_driver::NavigateResult result;
        result.success = url.find("invalid") == std::string::npos;
        if (!result.success) {
            result.error_text = "net::ERR_NAME_NOT_RESOLVED";
        }
        return result;
    };
    backend.capture_screenshot = [&recorded](const browser_driver::CaptureScreenshotOptions &options) {
        recorded.screenshots++;
        browser_driver::CaptureScreenshotResult result;
        result.success = true;
        result.image_base64 = "AAAA";
        result.mime_type = "image/" + options.format;
        return result;
    };
    backend.sleep = [&recorded](std::chrono::milliseconds duration) { recorded.slept_ms += duration.count(); };
    return backend;
}

static BrowserAction action_at(ActionType type, double x, double y) {
    BrowserAction action;
    action.type = type;
    action.coordinate.x = x;
    action.coordinate.y = y;
    return action;
}

static bool test_resolve_key() {
    input_executor::KeyDefinition key;
    bool success = check(input_executor::resolve_key("Return", key) && key.key == "Enter" &&
                         key.windows_virtual_key_code == 13 && key.text == "\r", "Return resolves to Enter");
    success &= check(input_executor::resolve_key("pagedown", key) && key.code == "PageDown", "pagedown alias");
    success &= check(input_executor::resolve_key("ArrowLeft", key) && key.windows_virtual_key_code == 37,
                     "DOM key names are accepted case-insensitively");
    success &= check(input_executor::resolve_key("a", key) && key.code == "KeyA" && key.text == "a" &&
                     key.windows_virtual_key_code == 'A', "Letters map to KeyX codes");
    success &= check(input_executor::resolve_key("7", key) && key.code == "Digit7", "Digits map to DigitN codes");
    success &= check(input_executor::resolve_key("cmd", key) && key.modifier_bit == browser_driver::MODIFIER_META,
                     "cmd is the Meta modifier");
    success &= check(!input_executor::resolve_key("hyper", key), "Unknown names are rejected");
    return success;
}

static bool test_parse_key_combination() {
    input_executor::KeyCombination combination;
    std::string error_detail;
    bool success = check(input_executor::parse_key_combination("ctrl+shift+p", combination, error_detail) &&
                         combination.modifiers.size() == 2 && combination.has_main_key &&
                         combination.main_key.code == "KeyP", "ctrl+shift+p has two modifiers and P");
    success &= check(input_executor::parse_key_combination("ctrl++", combination, error_detail) &&
                     combination.has_main_key && combination.main_key.key == "+", "ctrl++ presses the plus key");
    success &= check(input_executor::parse_key_combination("shift", combination, error_detail) &&
                     !combination.has_main_key && combination.modifiers.size() == 1, "A lone modifier is allowed");
    success &= check(!input_executor::parse_key_combination("a+b", combination, error_detail) &&
                     error_detail.find("more than one") != std::string::npos, "Two main keys are rejected");
    success &= check(!input_executor::parse_key_combination("ctrl+bogus", combination, error_detail) &&
                     error_detail.find("bogus") != std::string::npos, "Unknown key is named in the error");
    success &= check(!input_executor::parse_key_combination("  ", combination, error_detail), "Blank text is rejected");
    return success;
}

static bool test_scroll_delta_and_drag_path() {
    input_executor::ScrollDelta down = input_executor::scroll_delta(browser_action::ScrollDirection::Down, 3, "");
    input_executor::ScrollDelta shifted = input_executor::scroll_delta(browser_action::ScrollDirection::Up, 2, "shift");
    input_executor::ScrollDelta left = input_executor::scroll_delta(browser_action::ScrollDirection::Left, 1, "");
    bool success = check(down.delta_y == 300 && down.delta_x == 0, "Scrolling down 3 units is 300 px");
    success &= check(shifted.delta_x == -200 && shifted.delta_y == 0, "Shift turns vertical scrolling horizontal");
    success &= check(left.delta_x == -100, "Scrolling left is a negative x delta");

    browser_action::Coordinate start;
    browser_action::Coordinate end;
    end.x = 100;
    end.y = 50;
    std::vector<browser_action::Coordinate> path = input_executor::drag_path(start, end, 10);
    success &= check(path.size() == 10 && path[0].x == 10 && path[0].y == 5 && path[9].x == 100 && path[9].y == 50,
                     "Drag path steps evenly and ends on the target");
    return success;
}

static bool test_clicks() {
    RecordedInput recorded;
    input_executor::InputExecutor executor(recording_backend(recorded));

    browser_action::ActionResult result = executor.execute(action_at(ActionType::LeftClick, 40, 60));
    bool success = check(result.success && result.completed_at_ms > 0, "left_click succeeds");
    success &= check(recorded.mouse_events.size() == 3 && recorded.mouse_events[0].type == "mouseMoved" &&
                     recorded.mouse_events[1].type == "mousePressed" && recorded.mouse_events[1].button == "left" &&
                     recorded.mouse_events[1].x == 40 && recorded.mouse_events[2].type == "mouseReleased",
                     "left_click moves, presses and releases at the coordinate");

    recorded.mouse_events.clear();
    executor.execute(action_at(ActionType::TripleClick, 5, 5));
    success &= check(recorded.mouse_events.size() == 7 && recorded.mouse_events[5].click_count == 3,
                     "triple_click sends three press/release pairs counting up to 3");

    recorded.mouse_events.clear();
    BrowserAction right = action_at(ActionType::RightClick, 1, 1);
    right.text = "ctrl";
    executor.execute(right);
    success &= check(recorded.mouse_events.size() == 3 && recorded.mouse_events[1].button == "right" &&
                     recorded.mouse_events[1].modifiers == browser_driver::MODIFIER_CTRL,
                     "Modifier is applied to the right click");
    success &= check(recorded.key_events.size() == 2 && recorded.key_events[0].key == "Control" &&
                     recorded.key_events[1].type == "keyUp", "Modifier key is held around the click");

    BrowserAction bad = action_at(ActionType::LeftClick, 1, 1);
    bad.text = "x";
    success &= check(!executor.execute(bad).success, "A non-modifier click modifier is rejected");
    return success;
}

static bool test_key_and_type() {
    RecordedInput recorded;
    input_executor::InputExecutor executor(recording_backend(recorded));

    BrowserAction shortcut;
    shortcut.type = ActionType::Key;
    shortcut.text = "ctrl+a";
    bool success = check(executor.execute(shortcut).success, "ctrl+a succeeds");
    success &= check(recorded.key_events.size() == 4 && recorded.key_events[0].key == "Control" &&
                     recorded.key_events[1].code == "KeyA" && recorded.key_events[1].type == "rawKeyDown" &&
                     recorded.key_events[1].text.empty() &&
                     recorded.key_events[1].modifiers == browser_driver::MODIFIER_CTRL &&
                     recorded.key_events[3].key == "Control" && recorded.key_events[3].type == "keyUp",
                     "Shortcut letter carries no text and modifiers are released last");

    recorded.key_events.clear();
    shortcut.text = "shift+b";
    executor.execute(shortcut);
    success &= check(recorded.key_events.size() == 4 && recorded.key_events[1].text == "B" &&
                     recorded.key_events[1].type == "keyDown", "Shift upper-cases a typed letter");

    BrowserAction unknown;
    unknown.type = ActionType::Key;
    unknown.text = "ctrl+nope";
    browser_action::ActionResult failed = executor.execute(unknown);
    success &= check(!failed.success && failed.error_detail.find("nope") != std::string::npos,
                     "Unknown key fails the action");

    recorded.key_events.clear();
    BrowserAction typing;
    typing.type = ActionType::Type;
    typing.text = "hello\nworld";
    success &= check(executor.execute(typing).success, "type succeeds");
    success &= check(recorded.inserted_text.size() == 2 && recorded.inserted_text[0] == "hello" &&
                     recorded.inserted_text[1] == "world", "Text is inserted around the newline");
    success &= check(recorded.key_events.size() == 2 && recorded.key_events[0].key == "Enter",
                     "Newline becomes an Enter press");

    BrowserAction hold;
    hold.type = ActionType::HoldKey;
    hold.key = "shift";
    hold.duration_seconds = 0.25;
    recorded.slept_ms = 0;
    success &= check(executor.execute(hold).success && recorded.slept_ms == 250, "hold_key holds for the duration");
    return success;
}

static bool test_scroll_and_drag() {
    RecordedInput recorded;
    input_executor::InputExecutor executor(recording_backend(recorded));

    BrowserAction scroll = action_at(ActionType::Scroll, 300, 200);
    scroll.scroll_direction = browser_action::ScrollDirection::Down;
    scroll.scroll_amount = 5;
    bool success = check(executor.execute(scroll).success, "scroll succeeds");
    success &= check(recorded.mouse_events.size() == 2 && recorded.mouse_events[1].type == "mouseWheel" &&
                     recorded.mouse_events[1].delta_y == 500 && recorded.mouse_events[1].x == 300,
                     "scroll sends a wheel event at the coordinate");

    scroll.scroll_amount = 0;
    success &= check(!executor.execute(scroll).success, "Zero scroll amount is rejected");

    recorded.mouse_events.clear();
    BrowserAction drag;
    drag.type = ActionType::LeftClickDrag;
    drag.start_coordinate.x = 10;
    drag.start_coordinate.y = 10;
    drag.end_coordinate.x = 110;
    drag.end_coordinate.y = 10;
    success &= check(executor.execute(drag).success, "left_click_drag succeeds");
    const std::vector<browser_driver::MouseEvent> &events = recorded.mouse_events;
    success &= check(events.size() == 2 + input_executor::DRAG_STEPS + 1 && events[1].type == "mousePressed" &&
                     events[2].button == "left" && events.back().type == "mouseReleased" &&
                     events.back().x == 110, "Drag presses, moves in steps and releases at the end");
    return success;
}

static bool test_other_actions() {
    RecordedInput recorded;
    input_executor::InputExecutor executor(recording_backend(recorded));

    BrowserAction wait;
    wait.type = ActionType::Wait;
    wait.duration_seconds = 1.5;
    bool success = check(executor.execute(wait).success && recorded.slept_ms == 1500, "wait sleeps for the duration");

    BrowserAction screenshot;
    screenshot.type = ActionType::Screenshot;
    browser_action::ActionResult captured = executor.execute(screenshot);
    success &= check(captured.success && captured.screenshot_base64 == "AAAA" && recorded.screenshots == 1,
                     "screenshot returns the captured image");

    BrowserAction navigate;
    navigate.type = ActionType::Navigate;
    navigate.url = "https://invalid.example";
    browser_action::ActionResult navigation = executor.execute(navigate);
    success &= check(!navigation.success && navigation.error_detail == "net::ERR_NAME_NOT_RESOLVED",
                     "Navigation error text is reported");

    BrowserAction zoom;
    zoom.type = ActionType::Zoom;
    zoom.region = {0, 0, 100, 100};
    size_t events_before = recorded.mouse_events.size() + recorded.key_events.size();
    success &= check(executor.execute(zoom).success &&
                     recorded.mouse_events.size() + recorded.key_events.size() == events_before,
                     "zoom sends no input");

    recorded.fail_mouse = true;
    browser_action::ActionResult failed = executor.execute(action_at(ActionType::MouseMove, 1, 1));
    success &= check(!failed.success && failed.error_detail == "target closed", "Backend failures are reported");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_resolve_key();
    all_passed &= test_parse_key_combination();
    all_passed &= test_scroll_delta_and_drag_path();
    all_passed &= test_clicks();
    all_passed &= test_key_and_type();
    all_passed &= test_scroll_and_drag();
    all_passed &= test_other_actions();
    return all_passed;
}

} // namespace test_input_executor
