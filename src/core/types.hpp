/**
 * @file types.hpp
 * @brief Базовые типы LoadMesh
 *
 * Определяет типы, используемые во всём проекте:
 * - ErrorCode / Error: коды и описание ошибок
 * - Result<T>: обёртка std::expected для обработки ошибок
 * - TimePoint / Clock: единые типы времени для записей метрик и алертов
 *
 * @note Ошибки передаются как значения. Исключения не пересекают
 *       границы компонентов.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace loadmesh {

// =============================================================================
// Время
// =============================================================================

/**
 * @brief Точка во времени для записей наблюдений и алертов
 *
 * Используются системные часы: границы исторических интервалов
 * выравниваются по абсолютному времени, а не по времени запуска.
 */
using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Источник текущего времени (подменяется в тестах)
 */
using ClockFn = std::function<TimePoint()>;

/**
 * @brief Часы по умолчанию
 */
[[nodiscard]] inline ClockFn system_clock_fn() {
    return [] { return std::chrono::system_clock::now(); };
}

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки балансировки (200-299)
    NoAvailableNodes = 200,
    FailoverExhausted = 201,
    NodeNotFound = 202,

    // Ошибки проверки здоровья (300-399)
    ProbeTimeout = 300,
    ProbeFailure = 301,

    // Сетевые ошибки (400-499)
    HttpRequestFailed = 400,
    HttpBadStatus = 401,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::NoAvailableNodes: return "Нет доступных узлов";
        case ErrorCode::FailoverExhausted: return "Не осталось узлов для failover";
        case ErrorCode::NodeNotFound: return "Узел не найден";
        case ErrorCode::ProbeTimeout: return "Таймаут проверки здоровья";
        case ErrorCode::ProbeFailure: return "Ошибка проверки здоровья";
        case ErrorCode::HttpRequestFailed: return "Ошибка HTTP запроса";
        case ErrorCode::HttpBadStatus: return "Некорректный HTTP статус";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * Пример использования:
 * @code
 * auto node = balancer.distribute(request, nodes);
 * if (!node) {
 *     std::cerr << node.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace loadmesh
