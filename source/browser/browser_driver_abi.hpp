#ifndef FRAMESYNC_BROWSER_DRIVER_ABI_HPP
#define FRAMESYNC_BROWSER_DRIVER_ABI_HPP

// Browser driver data types.
// The CDP driver fills these; the frame source, input executor and stream
// controller consume them without knowing about the protocol.

#include <cstdint>
#include <string>

namespace browser_driver {

// Settings used when launching the browser.
struct OpenBrowserOptions {
    bool headless = false;
    int viewport_width = 1280;
    int viewport_height = 800;
    std::string chrome_path;         // empty = search well-known locations
    std::string user_data_directory; // empty = per-process profile under /tmp
};

// Result of a browser driver operation.
struct DriverResult {
    bool success = false;
    std::string message;
    std::string error_detail;
};

// Result of navigation.
struct NavigateResult {
    bool success = false;
    std::string frame_id;
    std::string error_text; // CDP errorText if navigation failed
};

// Page.startScreencast parameters.
struct ScreencastOptions {
    std::string format = "jpeg";
    int quality = 80;
    int every_nth_frame = 1;
    int max_width = 1280;
    int max_height = 800;
};

struct CaptureScreenshotOptions {
    std::string format = "jpeg"; // "jpeg" | "png"
    int quality = 80;            // jpeg only
};

// Result of capturing a screenshot of the current tab.
struct CaptureScreenshotResult {
    bool success = false;
    std::string image_base64;
    std::string mime_type;   // e.g. "image/jpeg"
    std::string error_detail;
};

// Current URL and title of the attached page.
struct PageInfoResult {
    bool success = false;
    std::string url;
    std::string title;
    std::string error_detail;
};

// CDP Input modifier bit mask.
constexpr int MODIFIER_ALT = 1;
constexpr int MODIFIER_CTRL = 2;
constexpr int MODIFIER_META = 4;
constexpr int MODIFIER_SHIFT = 8;

// Input.dispatchMouseEvent parameters.
struct MouseEvent {
    std::string type;          // mousePressed | mouseReleased | mouseMoved | mouseWheel
    double x = 0;
    double y = 0;
    std::string button = "none"; // none | left | middle | right
    int click_count = 0;
    int modifiers = 0;
    double delta_x = 0;        // mouseWheel only
    double delta_y = 0;
};

// Input.dispatchKeyEvent parameters.
struct KeyEvent {
    std::string type;          // keyDown | keyUp | rawKeyDown | char
    std::string key;           // DOM key value, e.g. "Enter", "a"
    std::string code;          // DOM code value, e.g. "Enter", "KeyA"
    std::string text;          // text generated by the key, empty for non-printing keys
    int windows_virtual_key_code = 0;
    int modifiers = 0;
};

} // namespace browser_driver

#endif // FRAMESYNC_BROWSER_DRIVER_ABI_HPP
