#ifndef FRAMESYNC_FRAME_TYPES_HPP
#define FRAMESYNC_FRAME_TYPES_HPP

// Frame data shared by the sampler, the buffer and the MCP layer.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace frames {

using EncodedImage = std::vector<uint8_t>;
using EncodedImagePtr = std::shared_ptr<const EncodedImage>;

// Screencast metadata, passed through untouched.
struct ViewMetadata {
    double device_scale_factor = 1.0;
    double page_scale_factor = 1.0;
    double offset_top = 0;
    double offset_left = 0;
    double scroll_offset_x = 0;
    double scroll_offset_y = 0;
    int device_width = 0;
    int device_height = 0;
};

// One capture as delivered by a FrameSource, before sampling.
struct RawFrame {
    EncodedImagePtr encoded_image;
    std::string mime_type = "image/jpeg";
    int64_t capture_timestamp_ms = 0;
    ViewMetadata view_metadata;
};

struct Frame {
    int64_t id = 0;
    int64_t captured_at_ms = 0;
    EncodedImagePtr pixels;
    std::string mime_type = "image/jpeg";
    bool changed = true;
    double delta_percent = 100.0;
    bool keep_alive = false;
    bool forced = false; // recaptured outside the comparison path; delta is synthetic
    ViewMetadata view_metadata;
};

// Frames are immutable once forwarded and shared between buffer, waiters and results.
using FramePtr = std::shared_ptr<const Frame>;

inline int64_t now_epoch_ms() {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace frames

#endif // FRAMESYNC_FRAME_TYPES_HPP
