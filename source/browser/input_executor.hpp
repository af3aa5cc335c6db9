#ifndef FRAMESYNC_INPUT_EXECUTOR_HPP
#define FRAMESYNC_INPUT_EXECUTOR_HPP

// Translates abstract BrowserActions into Input.* events.
// The events go to an InputBackend; cdp_input_backend() wires it to the CDP
// driver, tests substitute a recorder.

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "browser/browser_action.hpp"
#include "browser/browser_driver_abi.hpp"

namespace input_executor {

constexpr double SCROLL_PIXELS_PER_UNIT = 100.0;
constexpr int DRAG_STEPS = 10;

// One key as CDP wants it described.
struct KeyDefinition {
    std::string key;  // DOM key value
    std::string code; // DOM code value
    std::string text; // inserted text, empty for non-printing keys
    int windows_virtual_key_code = 0;
    int modifier_bit = 0; // non-zero for Shift/Control/Alt/Meta
};

// Accepts aliases ("return", "esc", "cmd", "pagedown"...), DOM names ("ArrowUp")
// and single printable characters. Returns false for anything else.
bool resolve_key(const std::string &name, KeyDefinition &out_key);

struct KeyCombination {
    std::vector<KeyDefinition> modifiers; // in press order
    KeyDefinition main_key;
    bool has_main_key = false;
};

// "ctrl+shift+p", "Return", "cmd+a". At most one non-modifier key.
bool parse_key_combination(const std::string &text, KeyCombination &out_combination, std::string &error_detail);

// Modifier bit for "shift" / "ctrl" / "alt" / "super" / "meta" (and aliases), 0 if none.
int modifier_mask(const std::string &modifier_name);

struct ScrollDelta {
    double delta_x = 0;
    double delta_y = 0;
};

// SCROLL_PIXELS_PER_UNIT per unit; a "shift" modifier turns vertical scrolling horizontal.
ScrollDelta scroll_delta(browser_action::ScrollDirection direction, int amount, const std::string &modifier);

// steps intermediate points from start (exclusive) to end (inclusive).
std::vector<browser_action::Coordinate> drag_path(const browser_action::Coordinate &start,
                                                  const browser_action::Coordinate &end, int steps);

// Where generated input goes.
struct InputBackend {
    std::function<browser_driver::DriverResult(const browser_driver::MouseEvent &)> dispatch_mouse_event;
    std::function<browser_driver::DriverResult(const browser_driver::KeyEvent &)> dispatch_key_event;
    std::function<browser_driver::DriverResult(const std::string &)> insert_text;
    std::function<browser_driver::NavigateResult(const std::string &)> navigate;
    std::function<browser_driver::CaptureScreenshotResult(const browser_driver::CaptureScreenshotOptions &)> capture_screenshot;
    std::function<void(std::chrono::milliseconds)> sleep;
};

InputBackend cdp_input_backend();

class InputExecutor {
public:
    explicit InputExecutor(InputBackend backend);

    // Runs one action to completion. Calls are serialized; failures are
    // reported in the result, never thrown.
    browser_action::ActionResult execute(const browser_action::BrowserAction &action);

private:
    browser_driver::DriverResult click(const browser_action::BrowserAction &action);
    browser_driver::DriverResult mouse_move(const browser_action::Coordinate &coordinate, const std::string &button);
    browser_driver::DriverResult mouse_button(const std::string &type, const browser_action::Coordinate &coordinate,
                                              const std::string &button, int click_count, int modifiers);
    browser_driver::DriverResult drag(const browser_action::Coordinate &start, const browser_action::Coordinate &end);
    browser_driver::DriverResult type_text(const std::string &text);
    browser_driver::DriverResult press_combination(const std::string &text);
    browser_driver::DriverResult key_down(const KeyDefinition &key, int modifiers);
    browser_driver::DriverResult key_up(const KeyDefinition &key, int modifiers);
    browser_driver::DriverResult scroll(const browser_action::BrowserAction &action);
    browser_driver::DriverResult hold_key(const std::string &key_name, double duration_seconds);
    void sleep_seconds(double seconds);

    InputBackend backend;
    std::mutex execute_mutex;
};

} // namespace input_executor

#endif // FRAMESYNC_INPUT_EXECUTOR_HPP
