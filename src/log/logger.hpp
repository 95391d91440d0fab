/**
 * @file logger.hpp
 * @brief Консольный журнал компонентов LoadMesh
 *
 * Формат строки:
 *   [2026-01-01 12:00:00] [WARN] [HealthMonitor] сообщение
 *
 * Предупреждения и ошибки выводятся в stderr, остальное в stdout.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace loadmesh::log {

/**
 * @brief Уровень журнала
 */
enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

/**
 * @brief Преобразовать уровень в строку
 */
[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из конфигурации ("error", "warn", "info", "debug")
 */
[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;

/**
 * @brief Журнал процесса
 *
 * Настраивается один раз в main(). По умолчанию уровень Warn,
 * поэтому тесты не засоряют вывод.
 */
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() const noexcept;

    void set_color(bool enabled) noexcept;

    [[nodiscard]] bool enabled(Level level) const noexcept {
        return static_cast<int>(level) <= static_cast<int>(level_.load());
    }

    /**
     * @brief Записать строку журнала
     *
     * @param level Уровень
     * @param component Имя компонента
     * @param message Сообщение
     */
    void write(Level level, std::string_view component, std::string_view message);

private:
    Logger() = default;

    std::atomic<Level> level_{Level::Warn};
    std::atomic<bool> color_{false};
    std::mutex mutex_;
};

/**
 * @brief Построитель строки журнала
 *
 * @code
 * log::info("LoadBalancer") << "выбран узел " << node.id;
 * @endcode
 *
 * Строка записывается в деструкторе, если уровень включён.
 */
class Line {
public:
    Line(Level level, std::string_view component)
        : level_(level), component_(component),
          active_(Logger::instance().enabled(level)) {}

    ~Line() {
        if (active_) {
            Logger::instance().write(level_, component_, stream_.str());
        }
    }

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template<typename T>
    Line& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

private:
    Level level_;
    std::string_view component_;
    bool active_;
    std::ostringstream stream_;
};

[[nodiscard]] inline Line error(std::string_view component) { return {Level::Error, component}; }
[[nodiscard]] inline Line warn(std::string_view component)  { return {Level::Warn, component}; }
[[nodiscard]] inline Line info(std::string_view component)  { return {Level::Info, component}; }
[[nodiscard]] inline Line debug(std::string_view component) { return {Level::Debug, component}; }

} // namespace loadmesh::log
