#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace rpcwire {

/// Component loggers backed by spdlog.
///
/// Components: "rpcwire" (default) and "transport". Any other name resolves
/// to the default logger. All methods are thread-safe; get_logger()
/// initializes with defaults on first use.
class LogManager {
public:
    /// Create the component loggers writing to a colored stderr sink.
    /// `level` is an spdlog level name: trace, debug, info, warn, error,
    /// critical, off. Only the first call has an effect.
    static void initialize(const std::string& level = "warn");

    /// Flush and drop all loggers. A later get_logger() reinitializes.
    static void shutdown();

    [[nodiscard]] static std::shared_ptr<spdlog::logger>
    get_logger(const std::string& component = "rpcwire");

    /// Change the level of every component logger.
    static void set_level(const std::string& level);
};

} // namespace rpcwire

#define RPCWIRE_LOG_DEBUG(...) ::rpcwire::LogManager::get_logger()->debug(__VA_ARGS__)
#define RPCWIRE_LOG_INFO(...)  ::rpcwire::LogManager::get_logger()->info(__VA_ARGS__)
#define RPCWIRE_LOG_WARN(...)  ::rpcwire::LogManager::get_logger()->warn(__VA_ARGS__)
#define RPCWIRE_LOG_ERROR(...) ::rpcwire::LogManager::get_logger()->error(__VA_ARGS__)

#define RPCWIRE_LOG_NET_TRACE(...) ::rpcwire::LogManager::get_logger("transport")->trace(__VA_ARGS__)
#define RPCWIRE_LOG_NET_DEBUG(...) ::rpcwire::LogManager::get_logger("transport")->debug(__VA_ARGS__)
#define RPCWIRE_LOG_NET_INFO(...)  ::rpcwire::LogManager::get_logger("transport")->info(__VA_ARGS__)
#define RPCWIRE_LOG_NET_WARN(...)  ::rpcwire::LogManager::get_logger("transport")->warn(__VA_ARGS__)
#define RPCWIRE_LOG_NET_ERROR(...) ::rpcwire::LogManager::get_logger("transport")->error(__VA_ARGS__)
