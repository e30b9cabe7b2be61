// File: batch/worker_pool.cpp

#include "batch/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

#include "common/logging/logger.hpp"

namespace batch {

    WorkerPool::WorkerPool(const unsigned int concurrency) :
        concurrency_(concurrency > 0 ? concurrency : std::max(1u, std::thread::hardware_concurrency())) {}

    std::size_t WorkerPool::run(const std::size_t count, const Task &task, const CancellationToken *token) const {
        if (count == 0) {
            return 0;
        }

        std::atomic<std::size_t> next_index{0};
        std::atomic<std::size_t> completed{0};
        std::exception_ptr failure;
        std::mutex failure_mutex;

        const auto worker = [&]() {
            while (true) {
                if (token && token->cancelled()) {
                    break;
                }
                const std::size_t index = next_index.fetch_add(1);
                if (index >= count) {
                    break;
                }
                try {
                    task(index);
                    completed.fetch_add(1);
                } catch (...) {
                    // keep the first failure for the caller and stop handing out work
                    const std::lock_guard lock(failure_mutex);
                    if (!failure) {
                        failure = std::current_exception();
                    }
                    next_index.store(count);
                    break;
                }
            }
        };

        const auto thread_count = static_cast<unsigned int>(std::min<std::size_t>(concurrency_, count));
        LOG_DEBUG("Running {} tasks on {} workers", count, thread_count);

        if (thread_count == 1) {
            worker();
        } else {
            std::vector<std::thread> threads;
            threads.reserve(thread_count);
            try {
                for (unsigned int i = 0; i < thread_count; ++i) {
                    threads.emplace_back(worker);
                }
            } catch (const std::exception &) {
                // carry on with the workers that did start, or on this thread if none did
                if (threads.empty()) {
                    worker();
                }
            }
            for (auto &thread: threads) {
                thread.join();
            }
            if (threads.size() < thread_count) {
                LOG_WARN("Only {} of {} worker threads could be started", threads.size(), thread_count);
            }
        }

        if (failure) {
            std::rethrow_exception(failure);
        }
        return completed.load();
    }

} // namespace batch
