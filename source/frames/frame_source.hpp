#ifndef FRAMESYNC_FRAME_SOURCE_HPP
#define FRAMESYNC_FRAME_SOURCE_HPP

// Push-based producer of captured frames (the CDP screencast in production,
// a scripted fake in tests).

#include <functional>
#include <string>

#include "browser/browser_driver_abi.hpp"
#include "frames/frame_types.hpp"

namespace frame_source {

// Called on the source's own thread for every captured frame.
using FrameHandler = std::function<void(frames::RawFrame raw_frame)>;

struct OnDemandCaptureResult {
    bool success = false;
    frames::RawFrame raw_frame;
    std::string error_detail;
};

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Replaces the handler; an empty handler stops delivery.
    virtual void set_frame_handler(FrameHandler handler) = 0;

    virtual browser_driver::DriverResult start_capture(const browser_driver::ScreencastOptions &options) = 0;
    virtual void stop_capture() = 0;

    // One-off snapshot outside the push stream. Blocking.
    virtual OnDemandCaptureResult capture_on_demand() = 0;
};

} // namespace frame_source

#endif // FRAMESYNC_FRAME_SOURCE_HPP
