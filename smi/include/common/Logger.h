#pragma once

#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

namespace SMI {

/**
 * @brief Logging facade shared by the runtime, generated machines and observers
 *
 * Backed by a single spdlog logger named "SMI", created on first use. Its
 * level comes from SPDLOG_LEVEL (default debug) until setLevel() is called.
 * Each line is prefixed with the calling function's name.
 *
 * @code
 * SMI::Logger::initialize("logs");   // console + logs/smi.log
 * SMI::Logger::setLevel(spdlog::level::info);
 * LOG_INFO("Machine {} entered {}", info.getName(), state.getInfo().getName());
 * @endcode
 */
class Logger {
public:
    // Console only when logDir is empty. No effect once the logger exists.
    static void initialize(const std::string &logDir = "");

    static void setLevel(spdlog::level::level_enum level);
    static spdlog::level::level_enum getLevel();

    static void log(spdlog::level::level_enum level, const std::string &message,
                    const std::source_location &loc = std::source_location::current());
};

}  // namespace SMI

#define LOG_TRACE(...) SMI::Logger::log(spdlog::level::trace, fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) SMI::Logger::log(spdlog::level::debug, fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) SMI::Logger::log(spdlog::level::info, fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) SMI::Logger::log(spdlog::level::warn, fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) SMI::Logger::log(spdlog::level::err, fmt::format(__VA_ARGS__), std::source_location::current())
