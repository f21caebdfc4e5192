/**
 * @file PersistenceQueue.cpp
 * @brief Asynchronous outbound queue in front of a RoundStore
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Game/RoundStore.hpp>
#include <Ascent/Core/Logger.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <system_error>
#include <thread>

namespace Ascent::Game {

// ============================================================================
// PersistenceQueue::Impl
// ============================================================================

class PersistenceQueue::Impl {
public:
    struct Job {
        const char* name;
        std::function<Result<void>(RoundStore&)> run;
    };

    Impl(std::shared_ptr<RoundStore> store, size_t capacity)
        : m_store(std::move(store))
        , m_capacity(capacity == 0 ? 1 : capacity)
        , m_running(false)
    {
    }

    ~Impl() {
        stop();
    }

    Result<void> start() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_running) {
            return ErrorCode::InvalidState;
        }

        m_running = true;
        m_accepting = true;
        try {
            m_thread = std::thread(&Impl::workerLoop, this);
        } catch (const std::system_error& e) {
            m_running = false;
            ASCENT_LOG_ERROR_F("Persistence thread creation failed: %s", e.what());
            return ErrorCode::ThreadCreationFailed;
        }

        return Result<void>::Success();
    }

    void stop() noexcept {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_accepting = false;
            if (!m_running) {
                return;
            }
            m_running = false;
        }

        m_cv.notify_all();

        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    Result<void> enqueue(Job job) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (!m_accepting) {
                m_stats.dropped++;
                return ErrorCode::PersistenceUnavailable;
            }

            if (m_jobs.size() >= m_capacity) {
                m_stats.dropped++;
                ASCENT_LOG_WARNING_F("Persistence queue full, dropping %s", job.name);
                return ErrorCode::PersistenceQueueFull;
            }

            m_jobs.push_back(std::move(job));
            m_stats.enqueued++;
        }

        m_cv.notify_all();
        return Result<void>::Success();
    }

    bool waitIdle(Milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_idleCv.wait_for(lock, timeout, [this] { return m_jobs.empty() && !m_busy; });
    }

    PersistenceStatistics statistics() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stats;
    }

private:
    void workerLoop() {
        std::unique_lock<std::mutex> lock(m_mutex);

        while (true) {
            m_cv.wait(lock, [this] { return !m_running || !m_jobs.empty(); });

            // Drain what is left before exiting
            if (m_jobs.empty()) {
                if (!m_running) {
                    break;
                }
                continue;
            }

            Job job = std::move(m_jobs.front());
            m_jobs.pop_front();
            m_busy = true;
            lock.unlock();

            const bool ok = execute(job);

            lock.lock();
            m_busy = false;
            if (ok) {
                m_stats.written++;
            } else {
                m_stats.failed++;
            }
            m_idleCv.notify_all();
        }

        m_idleCv.notify_all();
    }

    bool execute(const Job& job) {
        if (!m_store) {
            return true;
        }

        try {
            auto result = job.run(*m_store);
            if (result.isFailure()) {
                ASCENT_LOG_ERROR_F("Persisting %s failed: %s", job.name,
                                   std::string(getErrorMessage(result.error())).c_str());
                return false;
            }
            return true;
        } catch (const std::exception& e) {
            ASCENT_LOG_ERROR_F("Persisting %s threw: %s", job.name, e.what());
            return false;
        }
    }

    std::shared_ptr<RoundStore> m_store;
    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::thread m_thread;
    std::atomic<bool> m_running;
    bool m_accepting = true;
    bool m_busy = false;
    std::deque<Job> m_jobs;
    PersistenceStatistics m_stats;
};

// ============================================================================
// PersistenceQueue - Public API
// ============================================================================

PersistenceQueue::PersistenceQueue(std::shared_ptr<RoundStore> store, size_t capacity)
    : m_impl(std::make_unique<Impl>(std::move(store), capacity)) {
}

PersistenceQueue::~PersistenceQueue() = default;

Result<void> PersistenceQueue::start() {
    return m_impl->start();
}

void PersistenceQueue::stop() noexcept {
    m_impl->stop();
}

Result<void> PersistenceQueue::enqueueRoundOpened(RoundRecord round) {
    return m_impl->enqueue({"round_opened",
        [round = std::move(round)](RoundStore& store) { return store.recordRoundOpened(round); }});
}

Result<void> PersistenceQueue::enqueueRoundClosed(RoundId roundId, WallTime endedAt) {
    return m_impl->enqueue({"round_closed",
        [roundId, endedAt](RoundStore& store) { return store.recordRoundClosed(roundId, endedAt); }});
}

Result<void> PersistenceQueue::enqueueBet(BetRecord bet) {
    return m_impl->enqueue({"bet",
        [bet = std::move(bet)](RoundStore& store) { return store.recordBet(bet); }});
}

bool PersistenceQueue::waitIdle(Milliseconds timeout) {
    return m_impl->waitIdle(timeout);
}

PersistenceStatistics PersistenceQueue::statistics() const {
    return m_impl->statistics();
}

} // namespace Ascent::Game
