#ifndef FRAMESYNC_STREAM_CONFIG_HPP
#define FRAMESYNC_STREAM_CONFIG_HPP

// Session configuration.
// Sources, later overriding earlier: built-in defaults, the JSON file named by
// FRAMESYNC_CONFIG, then FRAMESYNC_* environment variables.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "frames/frame_buffer.hpp"
#include "frames/frame_sampler.hpp"

namespace stream_config {

using json = nlohmann::json;

struct StreamConfig {
    // Browser surface.
    int viewport_width = 1280;
    int viewport_height = 800;
    bool headless = true;
    std::string chrome_path;          // empty: search PATH
    std::string user_data_directory;  // empty: per-process temp profile

    // Screencast.
    int jpeg_quality = 80;
    int every_nth_frame = 1;

    // Sampling.
    double delta_threshold_percent = delta_detector::DEFAULT_DELTA_THRESHOLD_PERCENT;
    int keep_alive_ms = 5000;
    int worker_count = 2;

    // Buffer and correlation.
    int max_buffer_size = 10;
    int stability_wait_ms = 200;
    int max_wait_ms = 2000;
    double stability_threshold_percent = 0.5;
};

// Every violated rule, one message each. Empty when the config is usable.
std::vector<std::string> validate(const StreamConfig &config);

// Overlays the keys present in object onto config (snake_case names, as in
// to_json). Unknown keys are ignored; a key with the wrong type is an error.
bool apply_json(const json &object, StreamConfig &config, std::string &error_detail);

using EnvironmentLookup = std::function<const char *(const char *name)>;

// Overlays FRAMESYNC_* variables. Unparseable values are skipped and reported
// in warnings.
void apply_environment(StreamConfig &config, const EnvironmentLookup &lookup,
                       std::vector<std::string> &warnings);

json to_json(const StreamConfig &config);

struct ConfigLoadResult {
    bool success = false;
    StreamConfig config;
    std::string source_description; // "defaults", or the file that was read
    std::vector<std::string> warnings;
    std::string error_detail;
};

// Reads a JSON config file; a top-level "stream" object is used when present.
ConfigLoadResult load_config_file(const std::string &file_path, const StreamConfig &base);

// Defaults -> $FRAMESYNC_CONFIG -> environment, then validate().
ConfigLoadResult load_config(const EnvironmentLookup &lookup);

// Views of the config for the individual components.
browser_driver::OpenBrowserOptions browser_options(const StreamConfig &config);
browser_driver::ScreencastOptions screencast_options(const StreamConfig &config);
frame_sampler::SamplerConfig sampler_config(const StreamConfig &config);
frame_buffer::FrameBufferConfig buffer_config(const StreamConfig &config);

} // namespace stream_config

#endif // FRAMESYNC_STREAM_CONFIG_HPP
