/**
 * @file json.hpp
 * @brief Минимальная работа с JSON для HTTP проверок и webhook
 *
 * Поиск значений по ключу верхнего уровня без полного разбора
 * и экранирование строк при формировании тела запроса.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace loadmesh::json {

/**
 * @brief Найти значение по ключу
 *
 * Строки возвращаются без кавычек, объекты и массивы целиком,
 * числа, bool и null как есть.
 */
[[nodiscard]] std::optional<std::string> extract_raw(std::string_view body, std::string_view key);

[[nodiscard]] std::optional<double> extract_number(std::string_view body, std::string_view key);

[[nodiscard]] std::optional<bool> extract_bool(std::string_view body, std::string_view key);

/**
 * @brief Экранировать строку для вставки в JSON (без кавычек)
 */
[[nodiscard]] std::string escape(std::string_view text);

} // namespace loadmesh::json
