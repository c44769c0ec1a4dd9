#include "photon/log/Log.hpp"

#include <array>
#include <iostream>
#include <mutex>

namespace photon::log {

namespace {

constexpr std::size_t kLevelCount = 4;

std::size_t indexOf(Level level) {
    return static_cast<std::size_t>(level);
}

LogHandler makeDefaultSink(Level level) {
    if (level == Level::Info || level == Level::Warning) {
        return [](std::string_view message) {
            std::cout << message;
            std::cout.flush();
        };
    }
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::array<LogHandler, kLevelCount> makeDefaultSinks() {
    return {makeDefaultSink(Level::Info),
            makeDefaultSink(Level::Warning),
            makeDefaultSink(Level::Error),
            makeDefaultSink(Level::Critical)};
}

std::mutex sinkMutex;
std::array<LogHandler, kLevelCount> handlers = makeDefaultSinks();

} // namespace

void setLogHandler(Level level, LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    handlers[indexOf(level)] = handler ? std::move(handler) : makeDefaultSink(level);
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    handlers = makeDefaultSinks();
}

void logAt(Level level, std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = handlers[indexOf(level)];
    }
    if (handler) {
        handler(message);
    }
}

void logInfo(std::string_view message) {
    logAt(Level::Info, message);
}

void logWarning(std::string_view message) {
    logAt(Level::Warning, message);
}

void logError(std::string_view message) {
    logAt(Level::Error, message);
}

void logCritical(std::string_view message) {
    logAt(Level::Critical, message);
}

} // namespace photon::log
