// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/observability/Metrics.h"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace sieve::observability;

// ==================== Counter Tests ====================

TEST(MetricsTest, CounterIncrementAndReset) {
    Counter counter("test.counter");
    EXPECT_EQ(MetricType::COUNTER, counter.getType());
    EXPECT_EQ("test.counter", counter.getName());

    counter.inc();
    counter.add(41);
    EXPECT_EQ(42, counter.get());
    EXPECT_DOUBLE_EQ(42.0, counter.getValue());

    counter.reset();
    EXPECT_EQ(0, counter.get());
}

TEST(MetricsTest, CounterIsThreadSafe) {
    Counter counter("test.concurrent");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&counter] {
            for (int i = 0; i < 10000; i++) {
                counter.inc();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(40000, counter.get());
}

// ==================== Gauge Tests ====================

TEST(MetricsTest, Gauge) {
    Gauge gauge("test.gauge");
    gauge.set(10);
    gauge.add(-3);
    EXPECT_DOUBLE_EQ(7.0, gauge.getValue());
}

// ==================== Timer Tests ====================

TEST(MetricsTest, TimerAveragesRecordings) {
    Timer timer("test.timer");
    EXPECT_DOUBLE_EQ(0.0, timer.getValue());

    timer.record(std::chrono::milliseconds(2));
    timer.record(std::chrono::milliseconds(4));
    EXPECT_EQ(2, timer.getCount());
    EXPECT_DOUBLE_EQ(6.0, timer.getTotalMs());
    EXPECT_DOUBLE_EQ(3.0, timer.getValue());
}

TEST(MetricsTest, ScopedTimerRecordsOnce) {
    Timer timer("test.scoped");
    {
        ScopedTimer scoped(timer);
    }
    EXPECT_EQ(1, timer.getCount());
}

// ==================== Registry Tests ====================

TEST(MetricsTest, RegistryReturnsSameInstance) {
    auto& registry = MetricsRegistry::instance();
    auto a = registry.getCounter("registry.same");
    auto b = registry.getCounter("registry.same");
    EXPECT_EQ(a.get(), b.get());

    a->add(5);
    registry.resetCounters();
    EXPECT_EQ(0, b->get());
}

TEST(MetricsTest, RegistryListsAllMetrics) {
    auto& registry = MetricsRegistry::instance();
    registry.getCounter("registry.list.counter");
    registry.getGauge("registry.list.gauge");
    registry.getTimer("registry.list.timer");

    int found = 0;
    for (const auto& metric : registry.getAllMetrics()) {
        if (metric->getName().rfind("registry.list.", 0) == 0) {
            found++;
        }
    }
    EXPECT_EQ(3, found);
}
