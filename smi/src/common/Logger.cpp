#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace SMI {

namespace {

constexpr const char *LOGGER_NAME = "SMI";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

std::shared_ptr<spdlog::logger> logger;

// SPDLOG_LEVEL wins over the built-in debug default
spdlog::level::level_enum levelFromEnvironment() {
    const char *envLevel = std::getenv("SPDLOG_LEVEL");
    if (!envLevel) {
        return spdlog::level::debug;
    }

    std::string levelStr(envLevel);
    std::transform(levelStr.begin(), levelStr.end(), levelStr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (levelStr == "trace") {
        return spdlog::level::trace;
    } else if (levelStr == "debug") {
        return spdlog::level::debug;
    } else if (levelStr == "info") {
        return spdlog::level::info;
    } else if (levelStr == "warn" || levelStr == "warning") {
        return spdlog::level::warn;
    } else if (levelStr == "err" || levelStr == "error") {
        return spdlog::level::err;
    } else if (levelStr == "critical") {
        return spdlog::level::critical;
    } else if (levelStr == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::debug;
}

std::shared_ptr<spdlog::logger> createLogger(const std::string &logDir) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(consoleSink);

    if (!logDir.empty()) {
        std::filesystem::create_directories(logDir);
        auto logPath = std::filesystem::path(logDir) / "smi.log";
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        fileSink->set_pattern(FILE_PATTERN);
        sinks.push_back(fileSink);
    }

    // Replaces any logger another component registered under the same name
    spdlog::drop(LOGGER_NAME);
    auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    created->set_level(levelFromEnvironment());
    spdlog::register_logger(created);
    return created;
}

spdlog::logger &instance() {
    if (!logger) {
        logger = createLogger("");
    }
    return *logger;
}

// "ns::Class::method" out of the compiler's full signature
std::string cleanFunctionName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    size_t nameEnd = parenPos;
    while (nameEnd > 0 && (std::isspace(static_cast<unsigned char>(fullName[nameEnd - 1])) ||
                           fullName[nameEnd - 1] == ')')) {
        nameEnd--;
    }

    // Last space outside template arguments separates the return type
    size_t nameStart = 0;
    int angleDepth = 0;
    int parenDepth = 0;
    for (size_t i = 0; i < nameEnd; i++) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (c == '(') {
            parenDepth++;
        } else if (c == ')') {
            parenDepth--;
        } else if (c == ' ' && angleDepth == 0 && parenDepth == 0) {
            nameStart = i + 1;
        }
    }

    std::string qualifiedName = fullName.substr(nameStart, nameEnd - nameStart);
    while (!qualifiedName.empty() && (std::isspace(static_cast<unsigned char>(qualifiedName[0])) ||
                                      qualifiedName[0] == '*' || qualifiedName[0] == '&')) {
        qualifiedName.erase(0, 1);
    }

    std::string result;
    int templateDepth = 0;
    for (char c : qualifiedName) {
        if (c == '<') {
            templateDepth++;
        } else if (c == '>') {
            templateDepth--;
        } else if (templateDepth == 0) {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace

void Logger::initialize(const std::string &logDir) {
    if (logger) {
        return;
    }
    logger = createLogger(logDir);
}

void Logger::setLevel(spdlog::level::level_enum level) {
    instance().set_level(level);
}

spdlog::level::level_enum Logger::getLevel() {
    return instance().level();
}

void Logger::log(spdlog::level::level_enum level, const std::string &message, const std::source_location &loc) {
    spdlog::logger &target = instance();
    if (target.should_log(level)) {
        target.log(level, cleanFunctionName(loc) + "() - " + message);
    }
}

}  // namespace SMI
