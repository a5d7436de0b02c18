#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>

namespace rcp {
namespace log {

// ============================================================================
// Log Levels (runtime configurable)
// ============================================================================
enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// Parse a level name (trace, debug, info, warn, error, critical, off).
// Unknown names yield std::nullopt.
std::optional<Level> parse_level(std::string_view name);
std::string_view level_name(Level level);

// ============================================================================
// Log Configuration
// ============================================================================
struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    bool console{true};
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10 MB
    size_t max_files{5};

    // Module-specific levels, e.g. {"client.transport", Level::Trace}
    std::unordered_map<std::string, Level> module_levels;
};

// ============================================================================
// Initialization
// ============================================================================

// Initialize logging with the given configuration
void init(const LogConfig& config = LogConfig{});

// Initialize logging from environment variables
// RCP_LOG_LEVEL: trace, debug, info, warn, error, critical, off
// RCP_LOG_FILE: path to log file
void init_from_env();

// Set the global level. Modules without an explicit level follow it.
void set_level(Level level);
Level get_level();

// Set a level for one module; "client" also covers "client.transport".
void set_module_level(const std::string& module, Level level);

// Attach an extra sink to every existing and future logger
void add_sink(spdlog::sink_ptr sink);
void remove_sink(const spdlog::sink_ptr& sink);

// Flush all loggers
void flush();

// Shutdown logging
void shutdown();

spdlog::level::level_enum to_spdlog_level(Level level);

// ============================================================================
// Logger class for component-specific logging
// ============================================================================

class Logger {
public:
    // Get logger for a module (creates if not exists)
    static Logger& get(const std::string& module);

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->critical(fmt, std::forward<Args>(args)...);
    }

    bool should_log(Level level) const {
        return logger_->should_log(to_spdlog_level(level));
    }

    const std::string& module() const { return module_; }

private:
    friend class Registry;
    Logger(std::string module, std::shared_ptr<spdlog::logger> logger)
        : module_(std::move(module)), logger_(std::move(logger)) {}

    std::string module_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace log
} // namespace rcp
