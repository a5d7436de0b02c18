#include "common/log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <vector>

namespace rcp::log {

// Owns every module logger and the shared sink list
class Registry {
public:
    static Registry& instance() {
        static Registry registry;
        return registry;
    }

    void init(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
        build_sinks();
        for (auto& [name, logger] : loggers_) {
            logger->logger_->sinks() = all_sinks();
            logger->logger_->set_pattern(config_.pattern);
            logger->logger_->set_level(to_spdlog_level(resolve_level(name)));
        }
        initialized_ = true;
    }

    Logger& get(const std::string& module) {
        std::lock_guard<std::mutex> lock(mutex_);

        // Auto-initialize with defaults if needed
        if (!initialized_) {
            build_sinks();
            initialized_ = true;
        }

        auto it = loggers_.find(module);
        if (it != loggers_.end()) {
            return *it->second;
        }

        auto sinks = all_sinks();
        auto spd = std::make_shared<spdlog::logger>(module, sinks.begin(), sinks.end());
        spd->set_pattern(config_.pattern);
        spd->set_level(to_spdlog_level(resolve_level(module)));

        auto logger = std::unique_ptr<Logger>(new Logger(module, std::move(spd)));
        auto& ref = *logger;
        loggers_[module] = std::move(logger);
        return ref;
    }

    void set_level(Level level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.level = level;
        refresh_levels();
    }

    Level get_level() {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.level;
    }

    void set_module_level(const std::string& module, Level level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.module_levels[module] = level;
        refresh_levels();
    }

    void add_sink(spdlog::sink_ptr sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        extra_sinks_.push_back(sink);
        for (auto& [name, logger] : loggers_) {
            logger->logger_->sinks().push_back(sink);
        }
    }

    void remove_sink(const spdlog::sink_ptr& sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase(extra_sinks_, sink);
        for (auto& [name, logger] : loggers_) {
            std::erase(logger->logger_->sinks(), sink);
        }
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, logger] : loggers_) {
            logger->logger_->flush();
        }
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, logger] : loggers_) {
            logger->logger_->flush();
            logger->logger_->sinks().clear();
        }
        base_sinks_.clear();
        extra_sinks_.clear();
        initialized_ = false;
    }

private:
    Registry() = default;

    void build_sinks() {
        base_sinks_.clear();

        if (config_.console) {
            base_sinks_.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        if (!config_.file_path.empty()) {
            try {
                base_sinks_.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config_.file_path, config_.max_file_size, config_.max_files));
            } catch (const spdlog::spdlog_ex& e) {
                std::cerr << "Failed to open log file " << config_.file_path << ": " << e.what() << std::endl;
            }
        }
    }

    std::vector<spdlog::sink_ptr> all_sinks() const {
        std::vector<spdlog::sink_ptr> sinks = base_sinks_;
        sinks.insert(sinks.end(), extra_sinks_.begin(), extra_sinks_.end());
        return sinks;
    }

    // "client.transport" -> "client.transport", then "client", then global
    Level resolve_level(const std::string& module) const {
        std::string name = module;
        for (;;) {
            auto it = config_.module_levels.find(name);
            if (it != config_.module_levels.end()) {
                return it->second;
            }
            auto dot = name.rfind('.');
            if (dot == std::string::npos) {
                break;
            }
            name.resize(dot);
        }
        return config_.level;
    }

    void refresh_levels() {
        for (auto& [name, logger] : loggers_) {
            logger->logger_->set_level(to_spdlog_level(resolve_level(name)));
        }
    }

    std::mutex mutex_;
    LogConfig config_;
    bool initialized_ = false;
    std::vector<spdlog::sink_ptr> base_sinks_;
    std::vector<spdlog::sink_ptr> extra_sinks_;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers_;
};

std::optional<Level> parse_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error" || lower == "err") return Level::Error;
    if (lower == "critical" || lower == "crit") return Level::Critical;
    if (lower == "off") return Level::Off;
    return std::nullopt;
}

std::string_view level_name(Level level) {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Critical: return "critical";
        case Level::Off: return "off";
    }
    return "info";
}

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
        case Level::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

void init(const LogConfig& config) {
    Registry::instance().init(config);
}

void init_from_env() {
    LogConfig config;

    if (const char* level = std::getenv("RCP_LOG_LEVEL")) {
        if (auto parsed = parse_level(level)) {
            config.level = *parsed;
        }
    }

    if (const char* file = std::getenv("RCP_LOG_FILE")) {
        config.file_path = file;
    }

    init(config);
}

Logger& Logger::get(const std::string& module) {
    return Registry::instance().get(module);
}

void set_level(Level level) {
    Registry::instance().set_level(level);
}

Level get_level() {
    return Registry::instance().get_level();
}

void set_module_level(const std::string& module, Level level) {
    Registry::instance().set_module_level(module, level);
}

void add_sink(spdlog::sink_ptr sink) {
    Registry::instance().add_sink(std::move(sink));
}

void remove_sink(const spdlog::sink_ptr& sink) {
    Registry::instance().remove_sink(sink);
}

void flush() {
    Registry::instance().flush();
}

void shutdown() {
    Registry::instance().shutdown();
}

} // namespace rcp::log
