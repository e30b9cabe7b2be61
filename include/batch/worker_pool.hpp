// File: batch/worker_pool.hpp

#ifndef BATCH_WORKER_POOL_HPP
#define BATCH_WORKER_POOL_HPP

#include <atomic>
#include <cstddef>
#include <functional>

namespace batch {

    // Shared stop flag. Tripping it stops new work from being claimed; running items finish.
    class CancellationToken {
    public:
        CancellationToken() = default;

        CancellationToken(const CancellationToken &) = delete;
        CancellationToken &operator=(const CancellationToken &) = delete;

        void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
        [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

    private:
        std::atomic<bool> cancelled_{false};
    };

    /*
     * Bounded fan-out / fan-in over an index range. run() starts min(concurrency, count) threads
     * that claim indices from an atomic counter and joins them all before returning, so every
     * write a task made to its own slot is visible to the caller afterwards.
     */
    class WorkerPool {
    public:
        using Task = std::function<void(std::size_t index)>;

        // 0 means one worker per hardware thread.
        explicit WorkerPool(unsigned int concurrency = 0);

        // Runs task(i) for i in [0, count) until done or cancelled; returns how many tasks ran.
        // The first exception a task lets escape is rethrown after all workers are joined.
        std::size_t run(std::size_t count, const Task &task, const CancellationToken *token = nullptr) const;

        [[nodiscard]] unsigned int concurrency() const noexcept { return concurrency_; }

    private:
        unsigned int concurrency_;
    };

} // namespace batch

#endif // BATCH_WORKER_POOL_HPP
