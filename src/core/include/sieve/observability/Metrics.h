// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sieve {
namespace observability {

/**
 * Names of the metrics recorded by the bulk-load pipeline.
 */
namespace metric_names {
inline constexpr const char* SORTER_SPILLS = "sorter.spills";
inline constexpr const char* SORTER_ENTRIES = "sorter.entries";
inline constexpr const char* SORTER_COMPACTIONS = "sorter.compactions";
inline constexpr const char* SORTER_BUFFERED_BYTES = "sorter.buffered_bytes";
inline constexpr const char* MERGER_MERGED_KEYS = "merger.merged_keys";
inline constexpr const char* STORE_WRITER_PUTS = "store_writer.puts";
inline constexpr const char* STORE_WRITER_MERGES = "store_writer.merges";
inline constexpr const char* STORE_WRITER_WRITE = "store_writer.write";
}  // namespace metric_names

/**
 * Metric types
 */
enum class MetricType {
    COUNTER,  // Monotonically increasing value
    GAUGE,    // Value that can go up or down
    TIMER     // Duration measurements
};

/**
 * Base metric interface
 */
class Metric {
public:
    virtual ~Metric() = default;
    virtual MetricType getType() const = 0;
    virtual std::string getName() const = 0;
    virtual double getValue() const = 0;
};

/**
 * Counter metric - monotonically increasing
 *
 * Use for: entries sorted, chunks spilled, keys merged
 */
class Counter : public Metric {
public:
    explicit Counter(const std::string& name)
        : name_(name)
        , value_(0) {}

    MetricType getType() const override { return MetricType::COUNTER; }

    std::string getName() const override { return name_; }

    double getValue() const override { return static_cast<double>(value_.load()); }

    int64_t get() const { return value_.load(std::memory_order_relaxed); }

    void inc() { value_.fetch_add(1, std::memory_order_relaxed); }

    void add(int64_t value) { value_.fetch_add(value, std::memory_order_relaxed); }

    void reset() { value_.store(0, std::memory_order_relaxed); }

private:
    std::string name_;
    std::atomic<int64_t> value_;
};

/**
 * Gauge metric - integral value that can go up or down
 *
 * Use for: bytes currently buffered by a sorter
 */
class Gauge : public Metric {
public:
    explicit Gauge(const std::string& name)
        : name_(name)
        , value_(0) {}

    MetricType getType() const override { return MetricType::GAUGE; }

    std::string getName() const override { return name_; }

    double getValue() const override { return static_cast<double>(value_.load()); }

    void set(int64_t value) { value_.store(value, std::memory_order_relaxed); }

    void add(int64_t delta) { value_.fetch_add(delta, std::memory_order_relaxed); }

private:
    std::string name_;
    std::atomic<int64_t> value_;
};

/**
 * Timer metric - duration measurements
 *
 * Use for: store writes, chunk merges
 */
class Timer : public Metric {
public:
    explicit Timer(const std::string& name)
        : name_(name)
        , count_(0)
        , totalNanos_(0) {}

    MetricType getType() const override { return MetricType::TIMER; }

    std::string getName() const override { return name_; }

    /**
     * Average duration in milliseconds
     */
    double getValue() const override {
        int64_t count = count_.load();
        if (count == 0)
            return 0.0;
        return (totalNanos_.load() / count) / 1000000.0;
    }

    void record(int64_t nanos) {
        count_.fetch_add(1, std::memory_order_relaxed);
        totalNanos_.fetch_add(nanos, std::memory_order_relaxed);
    }

    template<typename Duration>
    void record(const Duration& duration) {
        record(static_cast<int64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count()));
    }

    int64_t getCount() const { return count_.load(); }

    double getTotalMs() const { return totalNanos_.load() / 1000000.0; }

private:
    std::string name_;
    std::atomic<int64_t> count_;
    std::atomic<int64_t> totalNanos_;
};

/**
 * RAII timer for automatic duration measurement
 */
class ScopedTimer {
public:
    explicit ScopedTimer(Timer& timer)
        : timer_(timer)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() { timer_.record(std::chrono::steady_clock::now() - start_); }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Timer& timer_;
    std::chrono::steady_clock::time_point start_;
};

/**
 * Process-wide metrics registry
 */
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry registry;
        return registry;
    }

    /**
     * Register or get counter
     */
    std::shared_ptr<Counter> getCounter(const std::string& name) {
        return getOrCreate(counters_, name);
    }

    /**
     * Register or get gauge
     */
    std::shared_ptr<Gauge> getGauge(const std::string& name) { return getOrCreate(gauges_, name); }

    /**
     * Register or get timer
     */
    std::shared_ptr<Timer> getTimer(const std::string& name) { return getOrCreate(timers_, name); }

    std::vector<std::shared_ptr<Metric>> getAllMetrics() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::shared_ptr<Metric>> metrics;
        for (const auto& [name, counter] : counters_) {
            metrics.push_back(counter);
        }
        for (const auto& [name, gauge] : gauges_) {
            metrics.push_back(gauge);
        }
        for (const auto& [name, timer] : timers_) {
            metrics.push_back(timer);
        }
        return metrics;
    }

    /**
     * Resets every counter to 0 without invalidating handles held by components.
     */
    void resetCounters() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, counter] : counters_) {
            counter->reset();
        }
    }

private:
    MetricsRegistry() = default;

    template<typename M>
    std::shared_ptr<M> getOrCreate(std::map<std::string, std::shared_ptr<M>>& metrics,
                                   const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = metrics.find(name);
        if (it != metrics.end()) {
            return it->second;
        }

        auto metric = std::make_shared<M>(name);
        metrics[name] = metric;
        return metric;
    }

    std::map<std::string, std::shared_ptr<Counter>> counters_;
    std::map<std::string, std::shared_ptr<Gauge>> gauges_;
    std::map<std::string, std::shared_ptr<Timer>> timers_;
    mutable std::mutex mutex_;
};

}  // namespace observability
}  // namespace sieve
