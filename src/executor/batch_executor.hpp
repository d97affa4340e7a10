/**
 * @file batch_executor.hpp
 * @brief Runs independent calls in paced, bounded-concurrency chunks.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace fleet_mirror {

/**
 * @brief Chunked fan-out over a private ThreadPool.
 *
 * Calls are split into chunks of max_concurrent; a chunk starts only after
 * the previous one has fully completed and inter_batch_delay has passed.
 * The executor adds no retry or rate limiting of its own: callers wrap each
 * call before handing it over.
 */
class BatchExecutor {
public:
    template <typename T>
    using Call = std::function<Result<T>()>;

    using Sleeper = std::function<void(Duration)>;

    BatchExecutor(size_t worker_threads, Logger& logger, Sleeper sleeper = {});

    /**
     * @brief Run every call; results match the input in length and order.
     *
     * A call that throws yields an Unknown error in its slot.
     */
    template <typename T>
    std::vector<Result<T>> run_batched(const std::vector<Call<T>>& calls,
                                       size_t max_concurrent,
                                       Duration inter_batch_delay);

    [[nodiscard]] size_t worker_count() const noexcept { return pool_.thread_count(); }
    [[nodiscard]] uint64_t batches_run() const noexcept { return batches_run_.load(); }

private:
    void pause(Duration delay);

    template <typename T>
    static Result<T> collect(std::future<Result<T>>& future);

    ThreadPool pool_;
    Logger& logger_;
    Sleeper sleeper_;
    std::atomic<uint64_t> batches_run_{0};
};

// ── Template implementations ─────────────────

template <typename T>
std::vector<Result<T>> BatchExecutor::run_batched(const std::vector<Call<T>>& calls,
                                                  size_t max_concurrent,
                                                  Duration inter_batch_delay) {
    std::vector<Result<T>> results;
    results.reserve(calls.size());
    if (calls.empty()) return results;

    const size_t chunk = std::max<size_t>(max_concurrent, 1);
    const size_t chunk_count = (calls.size() + chunk - 1) / chunk;
    logger_.debug("batch", "Running " + std::to_string(calls.size()) + " calls in " +
                           std::to_string(chunk_count) + " batches of " + std::to_string(chunk));

    for (size_t start = 0; start < calls.size(); start += chunk) {
        const size_t end = std::min(start + chunk, calls.size());

        std::vector<std::future<Result<T>>> in_flight;
        in_flight.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            in_flight.push_back(pool_.submit([&call = calls[i]] { return call(); }));
        }
        for (auto& future : in_flight) {
            results.push_back(collect(future));
        }
        ++batches_run_;

        if (end < calls.size() && inter_batch_delay.count() > 0) {
            pause(inter_batch_delay);
        }
    }
    return results;
}

template <typename T>
Result<T> BatchExecutor::collect(std::future<Result<T>>& future) {
    try {
        return future.get();
    } catch (const std::exception& ex) {
        return Error{ErrorKind::Unknown, std::string{"call raised: "} + ex.what()};
    } catch (...) {
        return Error{ErrorKind::Unknown, "call raised a non-standard exception"};
    }
}

}  // namespace fleet_mirror
