/**
 * @file WorkerPool.h
 * @brief Fixed-size thread pool for blocking device operations
 *
 * Jobs run in FIFO order on a fixed set of threads. Results (and
 * exceptions) come back through std::future. Destruction or shutdown()
 * lets already-queued jobs finish, then joins. A job may destroy the
 * pool it runs on: its own thread is detached instead of joined and
 * keeps the queue state alive until it exits.
 */

#ifndef CASTSPEAK_WORKER_POOL_H
#define CASTSPEAK_WORKER_POOL_H

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(size_t threads = 2);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a callable
     * @throws std::runtime_error after shutdown()
     */
    template <typename F>
    auto submit(F&& fn) -> std::future<typename std::invoke_result<F>::type> {
        using Result = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        std::future<Result> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (m_state->stop) {
                throw std::runtime_error("WorkerPool: submit after shutdown");
            }
            m_state->jobs.push([task]() { (*task)(); });
        }
        m_state->cv.notify_one();
        return result;
    }

    // Drain queued jobs and join the workers (idempotent)
    void shutdown();

    size_t threadCount() const { return m_threads.size(); }
    size_t queueSize() const;

private:
    // Shared with the workers so a detached one never touches the pool
    struct State {
        std::queue<Job> jobs;
        std::mutex mutex;
        std::condition_variable cv;
        bool stop = false;
    };

    static void workerThread(std::shared_ptr<State> state);

    std::shared_ptr<State> m_state = std::make_shared<State>();
    std::vector<std::thread> m_threads;
};

#endif // CASTSPEAK_WORKER_POOL_H
