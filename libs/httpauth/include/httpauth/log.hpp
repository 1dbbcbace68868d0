#pragma once

#include <string>
#include <utility>

#include "spdlog/spdlog.h"

namespace httpauth
{

/**
 * Obtain global logger, which is initialized from
 * the following environment variables:
 *  - HTTPAUTH_LOG_LEVEL
 *  - HTTPAUTH_LOG_FILE
 *  - HTTPAUTH_LOG_FILE_MAXSIZE
 */
spdlog::logger& log();

/**
 * Log a runtime error and return the throwable object.
 * @param what Runtime error message.
 * @param args Further constructor arguments of error_t.
 * @return Error object of type error_t to throw.
 */
template<typename error_t = std::runtime_error, typename... Args>
error_t logRuntimeError(std::string const& what, Args&&... args) {
    log().error(what);
    return error_t(what, std::forward<Args>(args)...);
}

}
