/**
 * @file logger.cpp
 * @brief Реализация консольного журнала
 */

#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace loadmesh::log {

namespace {

/// @brief ANSI цвет для уровня
constexpr std::string_view color_for(Level level) noexcept {
    switch (level) {
        case Level::Error: return "\033[31m";
        case Level::Warn:  return "\033[33m";
        case Level::Info:  return "\033[32m";
        case Level::Debug: return "\033[90m";
        default: return "";
    }
}

constexpr std::string_view COLOR_RESET = "\033[0m";

} // namespace

std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "error") return Level::Error;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "info") return Level::Info;
    if (name == "debug") return Level::Debug;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(Level level) noexcept {
    level_.store(level);
}

Level Logger::level() const noexcept {
    return level_.load();
}

void Logger::set_color(bool enabled) noexcept {
    color_.store(enabled);
}

void Logger::write(Level level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    ss << "[" << to_string(level) << "] ";
    ss << "[" << component << "] ";
    ss << message;

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = (level <= Level::Warn) ? std::cerr : std::cout;

    if (color_.load()) {
        out << color_for(level) << ss.str() << COLOR_RESET << std::endl;
    } else {
        out << ss.str() << std::endl;
    }
}

} // namespace loadmesh::log
