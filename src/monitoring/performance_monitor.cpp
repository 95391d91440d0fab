/**
 * @file performance_monitor.cpp
 * @brief Реализация сбора метрик производительности
 */

#include "performance_monitor.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

namespace loadmesh::monitoring {

namespace {

constexpr std::string_view COMPONENT = "PerformanceMonitor";

using Milliseconds = std::chrono::milliseconds;

/**
 * @brief Накопитель наблюдений за интервал
 */
struct Accumulator {
    std::vector<double> latencies;
    uint64_t requests = 0;
    uint64_t bytes = 0;
    std::size_t errors = 0;

    PerformanceMetrics finish(double seconds, TimePoint timestamp) && {
        PerformanceMetrics m;
        m.latency.p50 = nearest_rank_percentile(latencies, 50.0);
        m.latency.p95 = nearest_rank_percentile(latencies, 95.0);
        m.latency.p99 = nearest_rank_percentile(latencies, 99.0);

        if (seconds > 0.0) {
            m.throughput.requests_per_second = static_cast<double>(requests) / seconds;
            m.throughput.bytes_per_second = static_cast<double>(bytes) / seconds;
        }

        m.latency_samples = latencies.size();
        m.error_count = errors;

        auto total = m.latency_samples + m.error_count;
        if (total > 0) {
            m.error_rate = static_cast<double>(m.error_count) / static_cast<double>(total);
            m.availability = static_cast<double>(m.latency_samples) / static_cast<double>(total);
        }

        m.timestamp = timestamp;
        return m;
    }
};

int64_t epoch_ms(TimePoint t) {
    return std::chrono::duration_cast<Milliseconds>(t.time_since_epoch()).count();
}

int64_t floor_div(int64_t value, int64_t divisor) {
    auto q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

Alert threshold_alert(
    AlertCategory category,
    AlertSeverity severity,
    double threshold,
    double observed,
    std::string message
) {
    Alert alert;
    alert.category = category;
    alert.severity = severity;
    alert.threshold = threshold;
    alert.observed_value = observed;
    alert.message = std::move(message);
    return alert;
}

} // namespace

// =============================================================================
// Функции агрегации
// =============================================================================

double nearest_rank_percentile(std::vector<double> values, double percentile) {
    if (values.empty()) {
        return 0.0;
    }

    std::sort(values.begin(), values.end());

    auto n = static_cast<double>(values.size());
    auto rank = static_cast<int64_t>(std::ceil(percentile / 100.0 * n)) - 1;
    rank = std::clamp<int64_t>(rank, 0, static_cast<int64_t>(values.size()) - 1);
    return values[static_cast<std::size_t>(rank)];
}

ValidationResult validate_performance(
    const PerformanceMetrics& metrics,
    const PerformanceThresholds& thresholds
) {
    ValidationResult result;

    auto violation = [&result](std::string text, Alert alert) {
        result.violations.push_back(std::move(text));
        result.alerts.push_back(std::move(alert));
    };

    auto latency_check = [&](std::string_view name, double observed, double limit, AlertSeverity severity) {
        if (observed <= limit) {
            return;
        }
        std::ostringstream text;
        text << name << " latency " << observed << " мс превышает порог " << limit << " мс";
        std::ostringstream message;
        message << "Превышен порог " << name << " задержки";
        violation(text.str(), threshold_alert(AlertCategory::Latency, severity, limit, observed, message.str()));
    };

    latency_check("P50", metrics.latency.p50, thresholds.p50_ms, AlertSeverity::Warning);
    latency_check("P95", metrics.latency.p95, thresholds.p95_ms, AlertSeverity::Error);
    latency_check("P99", metrics.latency.p99, thresholds.p99_ms, AlertSeverity::Critical);

    if (metrics.throughput.requests_per_second < thresholds.min_requests_per_second) {
        std::ostringstream text;
        text << "Запросов в секунду " << metrics.throughput.requests_per_second
             << " ниже порога " << thresholds.min_requests_per_second;
        violation(text.str(), threshold_alert(AlertCategory::Throughput, AlertSeverity::Warning,
            thresholds.min_requests_per_second, metrics.throughput.requests_per_second,
            "Пропускная способность по запросам ниже порога"));
    }

    if (metrics.throughput.bytes_per_second < thresholds.min_bytes_per_second) {
        std::ostringstream text;
        text << "Поток данных " << metrics.throughput.bytes_per_second
             << " байт/с ниже порога " << thresholds.min_bytes_per_second << " байт/с";
        violation(text.str(), threshold_alert(AlertCategory::Throughput, AlertSeverity::Warning,
            thresholds.min_bytes_per_second, metrics.throughput.bytes_per_second,
            "Поток данных ниже порога"));
    }

    if (metrics.error_rate > thresholds.max_error_rate) {
        std::ostringstream text;
        text << std::fixed << std::setprecision(2)
             << "Доля ошибок " << metrics.error_rate * 100.0
             << "% превышает порог " << thresholds.max_error_rate * 100.0 << "%";
        violation(text.str(), threshold_alert(AlertCategory::ErrorRate, AlertSeverity::Error,
            thresholds.max_error_rate, metrics.error_rate, "Превышен порог доли ошибок"));
    }

    if (metrics.availability < thresholds.min_availability) {
        std::ostringstream text;
        text << std::fixed << std::setprecision(2)
             << "Доступность " << metrics.availability * 100.0
             << "% ниже порога " << thresholds.min_availability * 100.0 << "%";
        violation(text.str(), threshold_alert(AlertCategory::Availability, AlertSeverity::Critical,
            thresholds.min_availability, metrics.availability, "Доступность ниже порога"));
    }

    result.valid = result.violations.empty();
    return result;
}

// =============================================================================
// Внутренняя реализация
// =============================================================================

struct PerformanceMonitor::Impl {
    mutable std::mutex config_mutex;
    PerformanceConfig config;

    AlertManager& alerts;
    ClockFn clock;

    mutable std::mutex records_mutex;
    std::deque<LatencyRecord> latency;
    std::deque<ThroughputRecord> throughput;
    std::deque<ErrorRecord> errors;

    // Worker thread
    std::thread worker_thread;
    std::atomic<bool> running{false};
    std::condition_variable cv;
    std::mutex cv_mutex;

    Impl(const PerformanceConfig& cfg, AlertManager& am, ClockFn clk)
        : config(cfg), alerts(am), clock(std::move(clk)) {}

    PerformanceConfig current_config() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config;
    }

    /**
     * @brief Собрать записи, прошедшие фильтр, в один накопитель
     */
    template<typename Pred>
    Accumulator gather(Pred matches) const {
        std::lock_guard<std::mutex> lock(records_mutex);

        Accumulator acc;
        for (const auto& r : latency) {
            if (matches(r.operation, r.timestamp)) {
                acc.latencies.push_back(r.latency_ms);
            }
        }
        for (const auto& r : throughput) {
            if (matches(r.operation, r.timestamp)) {
                acc.requests += r.request_count;
                acc.bytes += r.bytes;
            }
        }
        for (const auto& r : errors) {
            if (matches(r.operation, r.timestamp)) {
                acc.errors++;
            }
        }
        return acc;
    }

    PerformanceMetrics collect_window(const std::optional<std::string>& operation) const {
        const auto cfg = current_config();
        const auto now = clock();
        const auto since = now - Milliseconds(cfg.window_ms);

        auto acc = gather([&](const std::string& op, TimePoint ts) {
            return ts >= since && (!operation || op == *operation);
        });

        return std::move(acc).finish(static_cast<double>(cfg.window_ms) / 1000.0, now);
    }

    void worker_loop() {
        while (running) {
            monitor_once();

            std::unique_lock<std::mutex> lock(cv_mutex);
            cv.wait_for(lock, Milliseconds(current_config().interval_ms), [this] {
                return !running.load();
            });
        }
    }

    /**
     * @brief Добавить запись; без рабочего потока заодно отбросить устаревшие
     *
     * Записи добавляются в порядке времени, поэтому устаревшие лежат в начале.
     */
    template<typename Record>
    void append(std::deque<Record>& records, Record record) {
        const auto cutoff = record.timestamp - Milliseconds(current_config().retention_period_ms);

        std::lock_guard<std::mutex> lock(records_mutex);
        if (!running) {
            while (!records.empty() && records.front().timestamp < cutoff) {
                records.pop_front();
            }
        }
        records.push_back(std::move(record));
    }

    void monitor_once();
    CollectionReport collect_with_alerting();
    std::size_t cleanup();
};

CollectionReport PerformanceMonitor::Impl::collect_with_alerting() {
    auto started = std::chrono::steady_clock::now();
    const auto cfg = current_config();

    CollectionReport report;
    report.metrics = collect_window(std::nullopt);
    report.timestamp = report.metrics.timestamp;

    auto validation = validate_performance(report.metrics, cfg.thresholds);
    report.alerts = std::move(validation.alerts);

    if (cfg.alerting_enabled) {
        for (auto& alert : report.alerts) {
            alert.timestamp = report.timestamp;
            alert.id = alerts.publish(alert);
        }
    }

    std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
    report.collection_duration_ms = elapsed.count();
    return report;
}

std::size_t PerformanceMonitor::Impl::cleanup() {
    const auto cutoff = clock() - Milliseconds(current_config().retention_period_ms);

    std::lock_guard<std::mutex> lock(records_mutex);

    auto purge = [cutoff](auto& records) {
        auto before = records.size();
        std::erase_if(records, [cutoff](const auto& r) { return r.timestamp < cutoff; });
        return before - records.size();
    };

    return purge(latency) + purge(throughput) + purge(errors);
}

void PerformanceMonitor::Impl::monitor_once() {
    auto report = collect_with_alerting();

    log::debug(COMPONENT) << "p50=" << report.metrics.latency.p50
                          << " p95=" << report.metrics.latency.p95
                          << " p99=" << report.metrics.latency.p99
                          << " rps=" << report.metrics.throughput.requests_per_second
                          << " ошибок=" << report.metrics.error_rate * 100.0 << "%"
                          << " алертов=" << report.alerts.size();

    auto purged = cleanup();
    if (purged > 0) {
        log::debug(COMPONENT) << "удалено устаревших записей: " << purged;
    }

    auto expired = alerts.cleanup_old(Milliseconds(current_config().retention_period_ms));
    if (expired > 0) {
        log::debug(COMPONENT) << "удалено устаревших алертов: " << expired;
    }
}

// =============================================================================
// PerformanceMonitor публичный интерфейс
// =============================================================================

PerformanceMonitor::PerformanceMonitor(
    const PerformanceConfig& config,
    AlertManager& alerts,
    ClockFn clock
)
    : impl_(std::make_unique<Impl>(config, alerts, std::move(clock)))
{
}

PerformanceMonitor::~PerformanceMonitor() {
    stop();
}

void PerformanceMonitor::record_latency(const std::string& operation, double latency_ms) {
    impl_->append(impl_->latency, LatencyRecord{operation, latency_ms, impl_->clock()});
}

void PerformanceMonitor::record_throughput(
    const std::string& operation,
    uint64_t request_count,
    uint64_t bytes,
    double duration_ms
) {
    impl_->append(impl_->throughput,
        ThroughputRecord{operation, request_count, bytes, duration_ms, impl_->clock()});
}

void PerformanceMonitor::record_error(const std::string& operation, const std::string& message) {
    impl_->append(impl_->errors, ErrorRecord{operation, message, impl_->clock()});
}

PerformanceMetrics PerformanceMonitor::collect() const {
    return impl_->collect_window(std::nullopt);
}

PerformanceMetrics PerformanceMonitor::collect_for(const std::string& operation) const {
    return impl_->collect_window(operation);
}

CollectionReport PerformanceMonitor::collect_with_alerting() {
    return impl_->collect_with_alerting();
}

std::vector<PerformanceMetrics> PerformanceMonitor::historical(
    TimePoint start,
    TimePoint end,
    std::optional<std::chrono::milliseconds> bucket
) const {
    const auto width = bucket.value_or(Milliseconds(impl_->current_config().bucket_ms)).count();
    if (width <= 0 || end < start) {
        return {};
    }

    const auto first = floor_div(epoch_ms(start), width);
    const auto last = floor_div(epoch_ms(end), width);

    std::map<int64_t, Accumulator> buckets;
    for (auto index = first; index <= last; ++index) {
        buckets[index];
    }

    {
        std::lock_guard<std::mutex> lock(impl_->records_mutex);

        // Граничные интервалы покрыты частично: записи вне [start, end] не учитываются
        auto slot = [&](TimePoint ts) -> Accumulator* {
            if (ts < start || ts > end) {
                return nullptr;
            }
            auto it = buckets.find(floor_div(epoch_ms(ts), width));
            return it != buckets.end() ? &it->second : nullptr;
        };

        for (const auto& r : impl_->latency) {
            if (auto* acc = slot(r.timestamp)) {
                acc->latencies.push_back(r.latency_ms);
            }
        }
        for (const auto& r : impl_->throughput) {
            if (auto* acc = slot(r.timestamp)) {
                acc->requests += r.request_count;
                acc->bytes += r.bytes;
            }
        }
        for (const auto& r : impl_->errors) {
            if (auto* acc = slot(r.timestamp)) {
                acc->errors++;
            }
        }
    }

    std::vector<PerformanceMetrics> result;
    result.reserve(buckets.size());
    for (auto& [index, acc] : buckets) {
        TimePoint bucket_start{Milliseconds(index * width)};
        result.push_back(std::move(acc).finish(static_cast<double>(width) / 1000.0, bucket_start));
    }
    return result;
}

std::size_t PerformanceMonitor::cleanup_old_records() {
    return impl_->cleanup();
}

void PerformanceMonitor::start() {
    const auto cfg = impl_->current_config();
    if (!cfg.enabled) {
        log::info(COMPONENT) << "сбор метрик отключён";
        return;
    }

    if (impl_->running.exchange(true)) {
        log::warn(COMPONENT) << "сбор метрик уже запущен";
        return;
    }

    impl_->worker_thread = std::thread([this] {
        impl_->worker_loop();
    });

    log::info(COMPONENT) << "сбор метрик запущен, интервал " << cfg.interval_ms << " мс";
}

void PerformanceMonitor::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->cv_mutex);
    }
    impl_->cv.notify_all();

    if (impl_->worker_thread.joinable()) {
        impl_->worker_thread.join();
    }

    log::info(COMPONENT) << "сбор метрик остановлен";
}

bool PerformanceMonitor::is_running() const noexcept {
    return impl_->running;
}

PerformanceConfig PerformanceMonitor::config() const {
    return impl_->current_config();
}

void PerformanceMonitor::update_config(const PerformanceConfig& config) {
    std::lock_guard<std::mutex> lock(impl_->config_mutex);
    impl_->config = config;
}

} // namespace loadmesh::monitoring
