#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace photon::log {

using LogHandler = std::function<void(std::string_view)>;

/**
 * @brief Severity of a log message.
 *
 * Info and Warning go to stdout by default, Error and Critical to stderr.
 * Critical is reserved for safety events (interlock loss, failed laser shutdown).
 */
enum class Level {
    Info,
    Warning,
    Error,
    Critical
};

/// Replace the sink for @p level; an empty handler restores the default.
void setLogHandler(Level level, LogHandler handler);
void resetLogHandlers();

void logAt(Level level, std::string_view message);

void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);
void logCritical(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename First, typename... Rest>
using EnableVariadic = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !IsStringViewConvertible<std::decay_t<First>>::value>;

} // namespace detail

template<typename First, typename... Rest,
         typename = detail::EnableVariadic<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    logInfo(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableVariadic<First, Rest...>>
void logWarning(First&& first, Rest&&... rest) {
    logWarning(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableVariadic<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    logError(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableVariadic<First, Rest...>>
void logCritical(First&& first, Rest&&... rest) {
    logCritical(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

} // namespace photon::log

namespace photon {
using log::LogHandler;
using log::logInfo;
using log::logWarning;
using log::logError;
using log::logCritical;
} // namespace photon
