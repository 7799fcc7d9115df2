#include "rpcwire/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <map>
#include <mutex>
#include <vector>

namespace rpcwire {

namespace {

const char* const kDefaultComponent = "rpcwire";

std::mutex s_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

// Caller holds s_mutex.
void initialize_locked(const std::string& level) {
    if (!s_loggers.empty()) return;

    try {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");

        const std::vector<std::string> components = {kDefaultComponent, "transport"};
        for (const auto& component : components) {
            // Loggers are kept out of spdlog's global registry so that an
            // embedding application can use the same names.
            auto logger = std::make_shared<spdlog::logger>(component, sink);
            logger->set_level(spdlog::level::from_str(level));
            logger->flush_on(spdlog::level::warn);
            s_loggers[component] = logger;
        }
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "rpcwire: log initialization failed: " << ex.what() << std::endl;
        s_loggers.clear();
        s_loggers[kDefaultComponent] = std::make_shared<spdlog::logger>(kDefaultComponent);
    }
}

} // anonymous namespace

void LogManager::initialize(const std::string& level) {
    std::lock_guard<std::mutex> lock(s_mutex);
    initialize_locked(level);
}

void LogManager::shutdown() {
    std::lock_guard<std::mutex> lock(s_mutex);
    for (auto& [name, logger] : s_loggers) {
        logger->flush();
    }
    s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::get_logger(const std::string& component) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_loggers.empty()) {
        initialize_locked("warn");
    }
    auto it = s_loggers.find(component);
    if (it != s_loggers.end()) {
        return it->second;
    }
    return s_loggers[kDefaultComponent];
}

void LogManager::set_level(const std::string& level) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_loggers.empty()) {
        initialize_locked(level);
        return;
    }
    auto log_level = spdlog::level::from_str(level);
    for (auto& [name, logger] : s_loggers) {
        logger->set_level(log_level);
    }
}

} // namespace rpcwire
