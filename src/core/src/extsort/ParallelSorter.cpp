// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/ParallelSorter.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace sieve {
namespace extsort {

namespace {

/**
 * Owns the spawned workers and joins them on every exit path. When the
 * scope unwinds before join(), the stop flag is raised first so workers
 * leave at their next partition boundary.
 */
class WorkerThreads {
public:
    explicit WorkerThreads(std::atomic<bool>& stop)
        : stop_(stop) {}

    ~WorkerThreads() {
        if (!joined_) {
            stop_.store(true, std::memory_order_relaxed);
            join();
        }
    }

    WorkerThreads(const WorkerThreads&) = delete;
    WorkerThreads& operator=(const WorkerThreads&) = delete;

    template <typename Fn>
    void spawn(Fn& fn, size_t worker) {
        threads_.emplace_back(std::ref(fn), worker);
    }

    void join() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        joined_ = true;
    }

private:
    std::atomic<bool>& stop_;
    std::vector<std::thread> threads_;
    bool joined_ = false;
};

}  // namespace

std::unique_ptr<ChunkReader> sortInParallel(const std::vector<std::unique_ptr<ChunkReader>>& partitions,
                                            const PartitionExtractor& extractor,
                                            MergeFunctionPtr mergeFn, const ChunkParameters& params,
                                            size_t numThreads,
                                            std::shared_ptr<ChunkCreator> creator) {
    if (!creator) {
        throw std::invalid_argument("sortInParallel requires a chunk creator");
    }
    numThreads = std::max<size_t>(1, std::min(numThreads, std::max<size_t>(partitions.size(), 1)));

    const auto perThread = params.maxMemoryPerThread(numThreads);
    std::vector<std::unique_ptr<ChunkReader>> results(numThreads);

    std::mutex errorMutex;
    std::exception_ptr firstError;
    std::atomic<bool> failed{false};

    auto work = [&](size_t worker) {
        try {
            Sorter sorter = createSorter(mergeFn, params, creator, perThread);
            for (size_t p = worker; p < partitions.size(); p += numThreads) {
                if (failed.load(std::memory_order_relaxed)) {
                    return;
                }
                extractor(*partitions[p], sorter);
            }
            results[worker] = sorterIntoReader(std::move(sorter), params, *creator);
        } catch (...) {
            // Recorded and rethrown on the calling thread after the join
            std::lock_guard<std::mutex> lock(errorMutex);
            if (!firstError) {
                firstError = std::current_exception();
            }
            failed.store(true, std::memory_order_relaxed);
        }
    };

    {
        WorkerThreads workers(failed);
        for (size_t w = 1; w < numThreads; w++) {
            workers.spawn(work, w);
        }
        work(0);
        workers.join();
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }

    if (results.size() == 1) {
        return std::move(results[0]);
    }
    return mergeReaders(std::move(results), std::move(mergeFn), params, *creator);
}

}  // namespace extsort
}  // namespace sieve
