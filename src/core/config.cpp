#include <sightline/core/config.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace sightline::core {

namespace {

double json_get_double(const json& j, const char* key, double default_val) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return default_val;
}

// Integer keys must fit in uint32_t; other value types fall back to the default
Result<uint32_t, Error> json_get_uint(const json& j, const char* key, uint32_t default_val) {
    if (!j.contains(key) || !j[key].is_number_integer()) {
        return default_val;
    }
    const json& value = j[key];
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() <= std::numeric_limits<uint32_t>::max()) {
        return static_cast<uint32_t>(value.get<uint64_t>());
    }
    return std::unexpected(Error(ErrorCode::InvalidConfig,
                                 std::format("'{}' must be an integer in [0, {}], got {}",
                                             key, std::numeric_limits<uint32_t>::max(), value.dump())));
}

bool json_get_bool(const json& j, const char* key, bool default_val) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return default_val;
}

std::string json_get_string(const json& j, const char* key, const std::string& default_val = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return default_val;
}

Option<LogLevel> parse_log_level(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    return std::nullopt;
}

} // namespace

double clamp_grid_resolution(double resolution) noexcept {
    if (!std::isfinite(resolution)) {
        return DEFAULT_GRID_RESOLUTION;
    }
    return std::clamp(resolution, MIN_GRID_RESOLUTION, MAX_GRID_RESOLUTION);
}

Result<void, Error> validate_config(const AnalysisConfig& config) {
    auto positive = [](double v) { return std::isfinite(v) && v > 0.0; };

    if (!positive(config.board_width) || !positive(config.board_height)) {
        return std::unexpected(Error(ErrorCode::InvalidConfig, "Board dimensions must be positive"));
    }
    if (!positive(config.grid_resolution)) {
        return std::unexpected(Error(ErrorCode::InvalidConfig, "Grid resolution must be positive"));
    }
    if (!positive(config.ray_step)) {
        return std::unexpected(Error(ErrorCode::InvalidConfig, "Ray step must be positive"));
    }
    if (config.ray_step < MIN_RAY_SAMPLE_STEP) {
        return std::unexpected(Error(ErrorCode::InvalidConfig,
                                     std::format("Ray step {} is below the minimum of {}",
                                                 config.ray_step, MIN_RAY_SAMPLE_STEP)));
    }
    if (!positive(config.index_cell_size)) {
        return std::unexpected(Error(ErrorCode::InvalidConfig, "Index cell size must be positive"));
    }
    if (!positive(config.zone_sample_spacing)) {
        return std::unexpected(Error(ErrorCode::InvalidConfig, "Zone sample spacing must be positive"));
    }
    return {};
}

Result<AnalysisConfig, Error> parse_analysis_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return std::unexpected(Error(ErrorCode::ConfigParseError, e.what()));
    }

    if (!root.is_object()) {
        return std::unexpected(Error(ErrorCode::ConfigParseError, "Config root must be an object"));
    }

    AnalysisConfig config;
    config.board_width = json_get_double(root, "boardWidth", config.board_width);
    config.board_height = json_get_double(root, "boardHeight", config.board_height);
    config.grid_resolution = clamp_grid_resolution(
        json_get_double(root, "gridResolution", config.grid_resolution));
    config.ray_step = json_get_double(root, "rayStep", config.ray_step);
    config.index_cell_size = json_get_double(root, "indexCellSize", config.index_cell_size);

    auto workers = json_get_uint(root, "workers", config.worker_count);
    if (!workers) {
        return std::unexpected(workers.error());
    }
    config.worker_count = *workers;

    auto deadline = json_get_uint(root, "deadlineMs", config.deadline_ms);
    if (!deadline) {
        return std::unexpected(deadline.error());
    }
    config.deadline_ms = *deadline;

    auto progress_steps = json_get_uint(root, "progressSteps", config.progress_steps);
    if (!progress_steps) {
        return std::unexpected(progress_steps.error());
    }
    config.progress_steps = std::max<uint32_t>(1, *progress_steps);
    config.zone_sample_spacing = json_get_double(root, "zoneSampleSpacing", config.zone_sample_spacing);

    if (root.contains("logging") && root["logging"].is_object()) {
        const json& logging = root["logging"];
        std::string level_name = json_get_string(logging, "level");
        if (!level_name.empty()) {
            auto level = parse_log_level(level_name);
            if (!level) {
                return std::unexpected(Error(ErrorCode::InvalidConfig,
                                             std::format("Unknown log level '{}'", level_name)));
            }
            config.logging.min_level = *level;
        }
        config.logging.console = json_get_bool(logging, "console", config.logging.console);
        config.logging.file_path = json_get_string(logging, "file", config.logging.file_path);
        config.logging.trace_rays = json_get_bool(logging, "traceRays", config.logging.trace_rays);
    }

    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }

    return config;
}

Result<AnalysisConfig, Error> load_analysis_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(Error(ErrorCode::FileNotFound,
                                     std::format("Cannot open config file: {}", path)));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_analysis_config(buffer.str());
    if (!config) {
        LOG_ERROR(Config, "Failed to load config {}: {}", path, config.error().message);
    } else {
        LOG_INFO(Config, "Loaded analysis config from {} (resolution {}\", step {}\")",
                 path, config->grid_resolution, config->ray_step);
    }
    return config;
}

void apply_logging_config(const LoggingConfig& config) {
    auto& logger = Logger::instance();
    logger.set_min_level(config.min_level);
    logger.set_console_output(config.console);
    if (!config.file_path.empty()) {
        logger.initialize(config.file_path, false, config.min_level);
    }
}

} // namespace sightline::core
