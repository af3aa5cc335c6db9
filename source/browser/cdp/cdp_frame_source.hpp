#ifndef FRAMESYNC_CDP_FRAME_SOURCE_HPP
#define FRAMESYNC_CDP_FRAME_SOURCE_HPP

// FrameSource over the CDP screencast: every Page.screencastFrame event is
// acknowledged, base64-decoded and handed to the frame handler.
// On-demand captures use Page.captureScreenshot.

#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <string>

#include "frames/frame_source.hpp"

namespace cdp_frame_source {

class CdpFrameSource : public frame_source::FrameSource {
public:
    CdpFrameSource() = default;
    ~CdpFrameSource() override;

    // Delivery holds the handler lock, so replacing the handler waits for an
    // in-flight frame to finish.
    void set_frame_handler(frame_source::FrameHandler handler) override;

    browser_driver::DriverResult start_capture(const browser_driver::ScreencastOptions &options) override;
    void stop_capture() override;
    frame_source::OnDemandCaptureResult capture_on_demand() override;

    bool is_capturing() const { return capturing.load(); }

private:
    void on_screencast_frame(const nlohmann::json &params);

    std::mutex handler_mutex;
    frame_source::FrameHandler frame_handler;
    std::atomic<bool> capturing{false};
    browser_driver::ScreencastOptions screencast_options;
    std::mutex options_mutex;
};

// Parses Page.screencastFrame params into a RawFrame. Returns false (with
// error_detail) when the payload is missing or not valid base64. The screencast
// session id to acknowledge is returned even when decoding fails.
bool parse_screencast_frame(const nlohmann::json &params, const std::string &image_format,
                            frames::RawFrame &out_frame, int &out_ack_session_id, std::string &error_detail);

} // namespace cdp_frame_source

#endif // FRAMESYNC_CDP_FRAME_SOURCE_HPP
