/**
 * @file Scheduler.cpp
 * @brief Worker-thread and manual timer schedulers
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Game/Scheduler.hpp>
#include <Ascent/Core/Logger.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <system_error>
#include <thread>

namespace Ascent::Game {

namespace {

void runTask(const std::string& name, const TimerTask& task) {
    try {
        task();
    } catch (const std::exception& e) {
        ASCENT_LOG_ERROR_F("Timer '%s' threw: %s", name.c_str(), e.what());
    }
}

} // namespace

// ============================================================================
// ThreadScheduler::Impl
// ============================================================================

class ThreadScheduler::Impl {
public:
    struct Entry {
        TimerId id;
        std::string name;
        TimerTask task;
    };

    Impl() : m_running(false) {}

    ~Impl() {
        stop();
    }

    Result<void> start() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_running) {
            return ErrorCode::InvalidState;
        }

        m_running = true;
        try {
            m_thread = std::thread(&Impl::workerLoop, this);
        } catch (const std::system_error& e) {
            m_running = false;
            ASCENT_LOG_ERROR_F("Scheduler thread creation failed: %s", e.what());
            return ErrorCode::ThreadCreationFailed;
        }

        return Result<void>::Success();
    }

    void stop() noexcept {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                return;
            }
            m_running = false;
            m_pending.clear();
        }

        m_cv.notify_one();

        if (m_thread.joinable()) {
            if (m_thread.get_id() == std::this_thread::get_id()) {
                // Stopped from inside a task; the loop exits after it returns
                m_thread.detach();
            } else {
                m_thread.join();
            }
        }
    }

    bool isRunning() const noexcept {
        return m_running.load();
    }

    TimerId scheduleAt(std::string name, TimePoint due, TimerTask task) {
        TimerId id = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            id = m_nextId++;
            m_pending.emplace(due, Entry{id, std::move(name), std::move(task)});
        }
        m_cv.notify_one();
        return id;
    }

    bool cancel(TimerId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_pending.begin(), m_pending.end(),
                               [id](const auto& item) { return item.second.id == id; });
        if (it == m_pending.end()) {
            return false;
        }
        m_pending.erase(it);
        return true;
    }

    std::vector<std::string> pendingNames() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> names;
        names.reserve(m_pending.size());
        for (const auto& item : m_pending) {
            names.push_back(item.second.name);
        }
        return names;
    }

private:
    void workerLoop() {
        std::unique_lock<std::mutex> lock(m_mutex);

        while (m_running) {
            if (m_pending.empty()) {
                m_cv.wait(lock, [this] { return !m_running || !m_pending.empty(); });
                continue;
            }

            const TimePoint due = m_pending.begin()->first;
            if (Clock::now() < due) {
                m_cv.wait_until(lock, due);
                continue;
            }

            auto node = m_pending.extract(m_pending.begin());
            lock.unlock();
            runTask(node.mapped().name, node.mapped().task);
            lock.lock();
        }
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    std::atomic<bool> m_running;
    TimerId m_nextId = 1;
    std::multimap<TimePoint, Entry> m_pending;
};

// ============================================================================
// ThreadScheduler - Public API
// ============================================================================

ThreadScheduler::ThreadScheduler()
    : m_impl(std::make_unique<Impl>()) {
}

ThreadScheduler::~ThreadScheduler() = default;

Result<void> ThreadScheduler::start() {
    return m_impl->start();
}

void ThreadScheduler::stop() noexcept {
    m_impl->stop();
}

bool ThreadScheduler::isRunning() const noexcept {
    return m_impl->isRunning();
}

TimePoint ThreadScheduler::now() const {
    return Clock::now();
}

TimerId ThreadScheduler::scheduleAt(std::string name, TimePoint due, TimerTask task) {
    return m_impl->scheduleAt(std::move(name), due, std::move(task));
}

bool ThreadScheduler::cancel(TimerId id) {
    return m_impl->cancel(id);
}

std::vector<std::string> ThreadScheduler::pendingNames() const {
    return m_impl->pendingNames();
}

// ============================================================================
// ManualScheduler
// ============================================================================

ManualScheduler::ManualScheduler()
    : m_now(TimePoint{} + Seconds(1)) {
}

ManualScheduler::~ManualScheduler() = default;

TimePoint ManualScheduler::now() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_now;
}

TimerId ManualScheduler::scheduleAt(std::string name, TimePoint due, TimerTask task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    TimerId id = m_nextId++;
    m_pending.emplace(due, Entry{id, std::move(name), std::move(task)});
    return id;
}

bool ManualScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_pending.begin(), m_pending.end(),
                           [id](const auto& item) { return item.second.id == id; });
    if (it == m_pending.end()) {
        return false;
    }
    m_pending.erase(it);
    return true;
}

std::vector<std::string> ManualScheduler::pendingNames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_pending.size());
    for (const auto& item : m_pending) {
        names.push_back(item.second.name);
    }
    return names;
}

size_t ManualScheduler::advance(Milliseconds delta) {
    TimePoint target;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        target = m_now + delta;
    }
    return runUntil(target);
}

size_t ManualScheduler::runDue() {
    return runUntil(now());
}

size_t ManualScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

size_t ManualScheduler::pendingCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_pending.begin(), m_pending.end(),
        [&name](const auto& item) { return item.second.name == name; }));
}

void ManualScheduler::setDuplicateDelivery(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_duplicate = enabled;
}

size_t ManualScheduler::runUntil(TimePoint target) {
    size_t executed = 0;

    while (true) {
        Entry entry;
        bool duplicate = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_pending.empty() || m_pending.begin()->first > target) {
                break;
            }
            auto node = m_pending.extract(m_pending.begin());
            m_now = std::max(m_now, node.key());
            entry = std::move(node.mapped());
            duplicate = m_duplicate;
        }

        runTask(entry.name, entry.task);
        ++executed;
        if (duplicate) {
            runTask(entry.name, entry.task);
            ++executed;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_now = std::max(m_now, target);
    return executed;
}

} // namespace Ascent::Game
