/**
 * @file constants.hpp
 * @brief Значения по умолчанию LoadMesh
 *
 * Все пороги и интервалы переопределяются конфигурацией.
 * Значения не настроены под конкретную нагрузку.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace loadmesh::constants {

// =============================================================================
// Балансировка
// =============================================================================

/// @brief Порог health score: узлы с оценкой не выше порога не выбираются
inline constexpr double DEFAULT_ELIGIBILITY_THRESHOLD = 50.0;

/// @brief Количество соединений, при котором запас по нагрузке равен нулю
inline constexpr uint64_t DEFAULT_MAX_CONNECTIONS = 1000;

/// @brief Сетевая задержка, при которой запас по сети равен нулю (мс)
inline constexpr double DEFAULT_MAX_LATENCY_MS = 1000.0;

/// @brief Коэффициенты весовой модели
inline constexpr double WEIGHT_HEALTH = 0.30;
inline constexpr double WEIGHT_CPU = 0.25;
inline constexpr double WEIGHT_MEMORY = 0.25;
inline constexpr double WEIGHT_NETWORK = 0.10;
inline constexpr double WEIGHT_LOAD = 0.10;

// =============================================================================
// Мониторинг здоровья
// =============================================================================

/// @brief Интервал цикла проверки здоровья (мс)
inline constexpr uint32_t DEFAULT_CHECK_INTERVAL_MS = 30000;

/// @brief Таймаут одной проверки (мс)
inline constexpr uint32_t DEFAULT_PROBE_TIMEOUT_MS = 5000;

/// @brief Количество попыток проверки
inline constexpr uint32_t DEFAULT_RETRY_ATTEMPTS = 3;

/// @brief Размер истории проверок на узел
inline constexpr std::size_t DEFAULT_HEALTH_HISTORY_SIZE = 100;

/// @brief Количество последних проверок для расчёта health score
inline constexpr std::size_t DEFAULT_SCORE_WINDOW = 5;

/// @brief Количество последних проверок для среднего времени ответа
inline constexpr std::size_t RESPONSE_TIME_WINDOW = 5;

/// @brief Размер истории алертов
inline constexpr std::size_t DEFAULT_ALERT_HISTORY_SIZE = 1000;

/// @brief Порог времени ответа (мс)
inline constexpr double DEFAULT_ALERT_LATENCY_MS = 2000.0;

/// @brief Порог доли ошибок узла
inline constexpr double DEFAULT_ALERT_ERROR_RATE = 0.05;

/// @brief Порог загрузки CPU (%)
inline constexpr double DEFAULT_ALERT_CPU_PCT = 80.0;

/// @brief Порог использования памяти (%)
inline constexpr double DEFAULT_ALERT_MEMORY_PCT = 85.0;

// =============================================================================
// Метрики производительности
// =============================================================================

/// @brief Интервал сбора метрик (мс)
inline constexpr uint32_t DEFAULT_PERF_INTERVAL_MS = 5000;

/// @brief Окно расчёта метрик (мс)
inline constexpr uint32_t DEFAULT_PERF_WINDOW_MS = 60000;

/// @brief Ширина интервала исторических метрик (мс)
inline constexpr uint32_t DEFAULT_PERF_BUCKET_MS = 60000;

/// @brief Срок хранения записей (мс), 24 часа
inline constexpr uint64_t DEFAULT_RETENTION_PERIOD_MS = 24ULL * 60 * 60 * 1000;

inline constexpr double DEFAULT_P50_MS = 1000.0;
inline constexpr double DEFAULT_P95_MS = 2000.0;
inline constexpr double DEFAULT_P99_MS = 5000.0;
inline constexpr double DEFAULT_MIN_RPS = 100.0;
inline constexpr double DEFAULT_MIN_BYTES_PER_SECOND = 1024.0 * 1024.0;
inline constexpr double DEFAULT_MAX_ERROR_RATE = 0.01;
inline constexpr double DEFAULT_MIN_AVAILABILITY = 0.99;

} // namespace loadmesh::constants
