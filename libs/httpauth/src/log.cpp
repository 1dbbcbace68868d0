#include "log.hpp"
#include <shared_mutex>
#include <iostream>
#include <cctype>
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace
{

std::string getEnvSafe(char const* env)
{
    if (auto value = std::getenv(env))
        return std::string(value);
    return {};
}

spdlog::level::level_enum parseLevel(std::string level)
{
    for (auto& ch : level)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    if (level == "error" || level == "err")
        return spdlog::level::err;
    if (level == "warning" || level == "warn")
        return spdlog::level::warn;
    if (level == "info")
        return spdlog::level::info;
    if (level == "debug" || level == "dbg")
        return spdlog::level::debug;
    if (level == "trace")
        return spdlog::level::trace;
    return spdlog::level::info;
}

}

spdlog::logger& httpauth::log()
{
    static std::shared_ptr<spdlog::logger> authLogger;
    static std::shared_mutex loggerAccess;

    {
        std::shared_lock<std::shared_mutex> readLock(loggerAccess);
        if (authLogger)
            return *authLogger;
    }

    std::lock_guard<std::shared_mutex> writeLock(loggerAccess);

    // Another thread might have won the race for the write lock
    if (authLogger)
        return *authLogger;

    auto logFile = getEnvSafe("HTTPAUTH_LOG_FILE");
    auto logFileMaxSize = getEnvSafe("HTTPAUTH_LOG_FILE_MAXSIZE");
    uint64_t logFileMaxSizeInt = 1024ull*1024*1024; // 1GB

    if (!logFile.empty()) {
        std::cerr << "Logging HTTP authentication events to '" << logFile << "'!" << std::endl;
        if (!logFileMaxSize.empty()) {
            try {
                logFileMaxSizeInt = std::stoull(logFileMaxSize);
            }
            catch (std::exception& e) {
                std::cerr << "Could not parse value of HTTPAUTH_LOG_FILE_MAXSIZE." << std::endl;
            }
        }
        authLogger = spdlog::rotating_logger_mt("httpauth", logFile, logFileMaxSizeInt, 2);
    }
    else
        authLogger = spdlog::stderr_color_mt("httpauth");

    authLogger->set_level(parseLevel(getEnvSafe("HTTPAUTH_LOG_LEVEL")));
    return *authLogger;
}
