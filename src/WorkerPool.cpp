/**
 * @file WorkerPool.cpp
 * @brief Worker pool implementation
 */

#include "WorkerPool.h"
#include "LogLevel.h"

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) threads = 1;
    LOG_DEBUG("[Pool] Starting " << threads << " worker thread(s)");

    for (size_t i = 0; i < threads; ++i) {
        m_threads.emplace_back(&WorkerPool::workerThread, m_state);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stop = true;
    }
    m_state->cv.notify_all();

    for (auto& t : m_threads) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) {
            // Called from one of our own jobs: that thread finishes on its own
            LOG_DEBUG("[Pool] Shutdown from a worker, detaching it");
            t.detach();
        } else {
            t.join();
        }
    }
}

size_t WorkerPool::queueSize() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->jobs.size();
}

void WorkerPool::workerThread(std::shared_ptr<State> state) {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&state]() {
                return state->stop || !state->jobs.empty();
            });

            // Queued work still runs after stop
            if (state->jobs.empty()) {
                break;
            }
            job = std::move(state->jobs.front());
            state->jobs.pop();
        }

        // packaged_task stores exceptions in the future
        job();
    }
}
