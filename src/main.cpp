/**
 * @file main.cpp
 * @brief Точка входа демона LoadMesh
 *
 * LoadMesh распределяет запросы между узлами по весовой модели,
 * следит за их здоровьем и перераспределяет нагрузку при отказах.
 *
 * Основные компоненты:
 * 1. Node Registry - известные узлы и их ресурсы
 * 2. Load Balancer - выбор узла и failover
 * 3. Health Monitor - периодическая HTTP проверка узлов
 * 4. Performance Monitor - перцентили задержки и пропускная способность
 * 5. Alert Manager - алерты и webhook
 *
 * Использование:
 *   loadmesh [options]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "engine/engine.hpp"
#include "log/logger.hpp"
#include "monitoring/http_probe.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
LoadMesh v)" << VERSION << R"(
Взвешенное распределение нагрузки с проверкой здоровья и failover

ИСПОЛЬЗОВАНИЕ:
    loadmesh [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (loadmesh.toml)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы
    --test-config        Проверить конфигурацию и выйти

ПРИМЕРЫ:
    loadmesh -c /etc/loadmesh/loadmesh.toml
    loadmesh --test-config

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "LoadMesh v" << VERSION << std::endl;
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
    }

    return args;
}

/**
 * @brief Строка статуса: узлы, соединения, алерты
 */
void report_status(loadmesh::Engine& engine) {
    auto health = engine.health().current_stats();
    auto load = engine.balancer().statistics();
    auto perf = engine.performance().collect();
    auto alerts = engine.alerts().counts();

    loadmesh::log::info("Status")
        << std::fixed << std::setprecision(1)
        << "узлы " << health.active_nodes << "/" << health.total_nodes
        << " (degraded " << health.degraded_nodes << ", failed " << health.failed_nodes << ")"
        << " | health " << health.overall_health_score << "%"
        << " | соединений " << load.total_connections
        << " | p95 " << perf.latency.p95 << " мс"
        << " | алертов " << alerts.total << " (critical " << alerts.critical << ")";
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace loadmesh;

    // Парсим аргументы
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Загружаем конфигурацию
    auto config_result = args.config_path
        ? Config::load(*args.config_path)
        : Config::load_with_search();

    if (!config_result) {
        log::error("Main") << config_result.error().message;
        return 1;
    }

    Config config = *config_result;

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        log::error("Main") << "Ошибка валидации конфигурации: " << validation.error().message;
        return 1;
    }

    auto& logger = log::Logger::instance();
    logger.set_level(log::parse_level(config.logging.level).value_or(log::Level::Info));
    logger.set_color(config.logging.color);

    log::info("Main") << "LoadMesh v" << VERSION << ", конфигурация загружена";

    if (args.test_config) {
        log::info("Main") << "Конфигурация валидна (узлов: " << config.nodes.size() << ")";
        return 0;
    }

    auto probe = std::make_shared<monitoring::HttpNodeProbe>(config.health.timeout_ms);

    auto engine_result = Engine::create(config, probe);
    if (!engine_result) {
        log::error("Main") << "Не удалось создать движок: " << engine_result.error().message;
        return 1;
    }
    auto engine = std::move(*engine_result);

    // Устанавливаем обработчики сигналов
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    engine->start();

    // Основной цикл
    const auto status_interval = std::chrono::milliseconds(config.logging.status_interval_ms);
    auto next_status = std::chrono::steady_clock::now() + status_interval;

    while (g_running.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (status_interval.count() > 0 && std::chrono::steady_clock::now() >= next_status) {
            report_status(*engine);
            next_status += status_interval;
        }
    }

    // Graceful shutdown
    log::info("Main") << "Получен сигнал завершения, останавливаем...";
    engine->stop();

    report_status(*engine);
    log::info("Main") << "LoadMesh остановлен";

    return 0;
}
