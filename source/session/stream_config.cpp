#include "session/stream_config.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <type_traits>

namespace stream_config {

std::vector<std::string> validate(const StreamConfig &config) {
    std::vector<std::string> problems;
    if (config.viewport_width < 1 || config.viewport_height < 1) {
        problems.push_back("viewport_width and viewport_height must be at least 1");
    }
    if (config.jpeg_quality < 1 || config.jpeg_quality > 100) {
        problems.push_back("jpeg_quality must be in [1, 100]");
    }
    if (config.every_nth_frame < 1) {
        problems.push_back("every_nth_frame must be at least 1");
    }
    if (config.delta_threshold_percent < 0 || config.delta_threshold_percent > 100) {
        problems.push_back("delta_threshold_percent must be in [0, 100]");
    }
    if (config.keep_alive_ms <= 0) {
        problems.push_back("keep_alive_ms must be positive");
    }
    if (config.worker_count < 1) {
        problems.push_back("worker_count must be at least 1");
    }
    if (config.max_buffer_size < 1) {
        problems.push_back("max_buffer_size must be at least 1");
    }

    // The buffer rules are stated once, in frame_buffer::validate.
    frame_buffer::FrameBufferConfig buffer;
    buffer.max_buffer_size = 1;
    buffer.stability_wait_ms = config.stability_wait_ms;
    buffer.max_wait_ms = config.max_wait_ms;
    buffer.stability_threshold_percent = config.stability_threshold_percent;
    for (const std::string &problem : frame_buffer::validate(buffer)) {
        problems.push_back(problem);
    }
    return problems;
}

template <typename Value>
static bool read_field(const json &object, const char *name, Value &out_value, std::string &error_detail) {
    if (!object.contains(name)) {
        return true;
    }
    const json &value = object[name];
    bool type_ok = false;
    if (std::is_same<Value, bool>::value) {
        type_ok = value.is_boolean();
    } else if (std::is_same<Value, int>::value) {
        type_ok = value.is_number_integer();
    } else if (std::is_same<Value, double>::value) {
        type_ok = value.is_number();
    } else {
        type_ok = value.is_string();
    }
    if (!type_ok) {
        error_detail = std::string("config key '") + name + "' has the wrong type";
        return false;
    }
    out_value = value.get<Value>();
    return true;
}

bool apply_json(const json &object, StreamConfig &config, std::string &error_detail) {
    if (!object.is_object()) {
        error_detail = "config must be a JSON object";
        return false;
    }
    StreamConfig updated = config;
    bool ok = read_field(object, "viewport_width", updated.viewport_width, error_detail) &&
              read_field(object, "viewport_height", updated.viewport_height, error_detail) &&
              read_field(object, "headless", updated.headless, error_detail) &&
              read_field(object, "chrome_path", updated.chrome_path, error_detail) &&
              read_field(object, "user_data_directory", updated.user_data_directory, error_detail) &&
              read_field(object, "jpeg_quality", updated.jpeg_quality, error_detail) &&
              read_field(object, "every_nth_frame", updated.every_nth_frame, error_detail) &&
              read_field(object, "delta_threshold_percent", updated.delta_threshold_percent, error_detail) &&
              read_field(object, "keep_alive_ms", updated.keep_alive_ms, error_detail) &&
              read_field(object, "worker_count", updated.worker_count, error_detail) &&
              read_field(object, "max_buffer_size", updated.max_buffer_size, error_detail) &&
              read_field(object, "stability_wait_ms", updated.stability_wait_ms, error_detail) &&
              read_field(object, "max_wait_ms", updated.max_wait_ms, error_detail) &&
              read_field(object, "stability_threshold_percent", updated.stability_threshold_percent, error_detail);
    if (!ok) {
        return false;
    }
    config = updated;
    return true;
}

static bool parse_int(const std::string &text, int &out_value) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out_value = value;
        return true;
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
}

static bool parse_double(const std::string &text, double &out_value) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out_value = value;
        return true;
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
}

static bool parse_bool(const std::string &text, bool &out_value) {
    std::string normalized = text;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        out_value = true;
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        out_value = false;
        return true;
    }
    return false;
}

void apply_environment(StreamConfig &config, const EnvironmentLookup &lookup, std::vector<std::string> &warnings) {
    auto read = [&lookup](const char *name, std::string &out_text) {
        const char *value = lookup(name);
        if (value == nullptr || value[0] == '\0') {
            return false;
        }
        out_text = value;
        return true;
    };
    auto reject = [&warnings](const char *name, const std::string &text) {
        warnings.push_back(std::string("ignoring ") + name + "='" + text + "'");
    };

    struct IntVariable {
        const char *name;
        int *target;
    };
    const IntVariable int_variables[] = {
        {"FRAMESYNC_VIEWPORT_WIDTH", &config.viewport_width},
        {"FRAMESYNC_VIEWPORT_HEIGHT", &config.viewport_height},
        {"FRAMESYNC_JPEG_QUALITY", &config.jpeg_quality},
        {"FRAMESYNC_EVERY_NTH_FRAME", &config.every_nth_frame},
        {"FRAMESYNC_KEEP_ALIVE_MS", &config.keep_alive_ms},
        {"FRAMESYNC_WORKER_COUNT", &config.worker_count},
        {"FRAMESYNC_MAX_BUFFER_SIZE", &config.max_buffer_size},
        {"FRAMESYNC_STABILITY_WAIT_MS", &config.stability_wait_ms},
        {"FRAMESYNC_MAX_WAIT_MS", &config.max_wait_ms},
    };
    std::string text;
    for (const IntVariable &variable : int_variables) {
        if (read(variable.name, text) && !parse_int(text, *variable.target)) {
            reject(variable.name, text);
        }
    }
    if (read("FRAMESYNC_DELTA_THRESHOLD", text) && !parse_double(text, config.delta_threshold_percent)) {
        reject("FRAMESYNC_DELTA_THRESHOLD", text);
    }
    if (read("FRAMESYNC_STABILITY_THRESHOLD", text) && !parse_double(text, config.stability_threshold_percent)) {
        reject("FRAMESYNC_STABILITY_THRESHOLD", text);
    }
    if (read("FRAMESYNC_HEADLESS", text) && !parse_bool(text, config.headless)) {
        reject("FRAMESYNC_HEADLESS", text);
    }
    if (read("FRAMESYNC_CHROME_PATH", text)) {
        config.chrome_path = text;
    }
    if (read("FRAMESYNC_USER_DATA_DIR", text)) {
        config.user_data_directory = text;
    }
}

json to_json(const StreamConfig &config) {
    json object;
    object["viewport_width"] = config.viewport_width;
    object["viewport_height"] = config.viewport_height;
    object["headless"] = config.headless;
    object["chrome_path"] = config.chrome_path;
    object["user_data_directory"] = config.user_data_directory;
    object["jpeg_quality"] = config.jpeg_quality;
    object["every_nth_frame"] = config.every_nth_frame;
    object["delta_threshold_percent"] = config.delta_threshold_percent;
    object["keep_alive_ms"] = config.keep_alive_ms;
    object["worker_count"] = config.worker_count;
    object["max_buffer_size"] = config.max_buffer_size;
    object["stability_wait_ms"] = config.stability_wait_ms;
    object["max_wait_ms"] = config.max_wait_ms;
    object["stability_threshold_percent"] = config.stability_threshold_percent;
    return object;
}

ConfigLoadResult load_config_file(const std::string &file_path, const StreamConfig &base) {
    ConfigLoadResult result;
    result.config = base;
    result.source_description = file_path;

    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        result.error_detail = "cannot read config file " + file_path;
        return result;
    }

    json document;
    try {
        document = json::parse(contents);
    } catch (const json::parse_error &error) {
        result.error_detail = "config file " + file_path + " is not valid JSON: " + error.what();
        return result;
    }

    const json &section = (document.is_object() && document.contains("stream")) ? document["stream"] : document;
    if (!apply_json(section, result.config, result.error_detail)) {
        result.error_detail = file_path + ": " + result.error_detail;
        return result;
    }
    result.success = true;
    return result;
}

ConfigLoadResult load_config(const EnvironmentLookup &lookup) {
    ConfigLoadResult result;
    result.source_description = "defaults";

    const char *config_path = lookup("FRAMESYNC_CONFIG");
    if (config_path != nullptr && config_path[0] != '\0') {
        result = load_config_file(config_path, StreamConfig());
        if (!result.success) {
            return result;
        }
        result.success = false;
    }

    apply_environment(result.config, lookup, result.warnings);

    std::vector<std::string> problems = validate(result.config);
    if (!problems.empty()) {
        result.error_detail = "invalid configuration:";
        for (const std::string &problem : problems) {
            result.error_detail += " " + problem + ";";
        }
        return result;
    }
    for (const std::string &warning : result.warnings) {
        debug_log::warn("config: " + warning);
    }
    debug_log::log("config: loaded from " + result.source_description);
    result.success = true;
    return result;
}

browser_driver::OpenBrowserOptions browser_options(const StreamConfig &config) {
    browser_driver::OpenBrowserOptions options;
    options.headless = config.headless;
    options.viewport_width = config.viewport_width;
    options.viewport_height = config.viewport_height;
    options.chrome_path = config.chrome_path;
    options.user_data_directory = config.user_data_directory;
    return options;
}

browser_driver::ScreencastOptions screencast_options(const StreamConfig &config) {
    browser_driver::ScreencastOptions options;
    options.format = "jpeg";
    options.quality = config.jpeg_quality;
    options.every_nth_frame = config.every_nth_frame;
    options.max_width = config.viewport_width;
    options.max_height = config.viewport_height;
    return options;
}

frame_sampler::SamplerConfig sampler_config(const StreamConfig &config) {
    frame_sampler::SamplerConfig sampler;
    sampler.delta_threshold_percent = config.delta_threshold_percent;
    sampler.keep_alive_ms = config.keep_alive_ms;
    sampler.worker_count = static_cast<size_t>(config.worker_count);
    sampler.max_queued_comparisons = static_cast<size_t>(config.worker_count) * 4;
    return sampler;
}

frame_buffer::FrameBufferConfig buffer_config(const StreamConfig &config) {
    frame_buffer::FrameBufferConfig buffer;
    buffer.max_buffer_size = static_cast<size_t>(config.max_buffer_size);
    buffer.stability_wait_ms = config.stability_wait_ms;
    buffer.max_wait_ms = config.max_wait_ms;
    buffer.stability_threshold_percent = config.stability_threshold_percent;
    return buffer;
}

} // namespace stream_config
