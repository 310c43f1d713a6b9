#include "keyward/core/log.hpp"
#include "keyward/core/constants.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdlib>
#include <map>
#include <mutex>
#include <string_view>
#include <vector>

namespace keyward::log {

namespace {

struct Registry {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    std::map<std::string, std::shared_ptr<spdlog::logger>, std::less<>> loggers;
    LogConfig config;
    bool configured = false;
};

Registry& Instance() {
    static Registry registry;
    return registry;
}

void BuildSinks(Registry& registry) {
    registry.sinks.clear();
    if (registry.config.console) {
        registry.sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!registry.config.file_path.empty()) {
        registry.sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            registry.config.file_path, registry.config.max_file_size, registry.config.max_files));
    }
}

std::shared_ptr<spdlog::logger> Attach(Registry& registry, const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, registry.sinks.begin(), registry.sinks.end());
    logger->set_level(registry.config.level);
    logger->set_pattern(registry.config.pattern);
    spdlog::drop(name);
    spdlog::register_logger(logger);
    registry.loggers[name] = logger;
    return logger;
}

}

void Init(const LogConfig& config) {
    auto& registry = Instance();
    std::lock_guard lock(registry.mutex);
    if (registry.configured) {
        return;
    }
    registry.config = config;
    registry.configured = true;
    BuildSinks(registry);
    // Loggers handed out before configuration keep their identity and switch sinks
    for (const auto& [name, logger] : registry.loggers) {
        logger->sinks() = registry.sinks;
        logger->set_level(config.level);
        logger->set_pattern(config.pattern);
    }
}

void InitFromEnv() {
    LogConfig config;
    if (const char* level = std::getenv(e2ee::kEnvLogLevel.data())) {
        // spdlog maps unknown names to off; keep the default instead
        if (const auto parsed = spdlog::level::from_str(level);
            parsed != spdlog::level::off || std::string_view(level) == "off") {
            config.level = parsed;
        }
    }
    if (const char* file = std::getenv(e2ee::kEnvLogFile.data())) {
        config.file_path = file;
    }
    Init(config);
}

std::shared_ptr<spdlog::logger> Get(const std::string& name) {
    auto& registry = Instance();
    std::lock_guard lock(registry.mutex);
    if (const auto it = registry.loggers.find(name); it != registry.loggers.end()) {
        return it->second;
    }
    if (registry.sinks.empty()) {
        BuildSinks(registry);
    }
    return Attach(registry, name);
}

void SetLevel(const spdlog::level::level_enum level) {
    auto& registry = Instance();
    std::lock_guard lock(registry.mutex);
    registry.config.level = level;
    for (const auto& [name, logger] : registry.loggers) {
        logger->set_level(level);
    }
}

void Flush() {
    auto& registry = Instance();
    std::lock_guard lock(registry.mutex);
    for (const auto& [name, logger] : registry.loggers) {
        logger->flush();
    }
}

void Shutdown() {
    auto& registry = Instance();
    std::lock_guard lock(registry.mutex);
    for (const auto& [name, logger] : registry.loggers) {
        logger->flush();
        spdlog::drop(name);
    }
    registry.loggers.clear();
    registry.sinks.clear();
    registry.config = LogConfig{};
    registry.configured = false;
}

}
