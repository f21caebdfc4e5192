/**
 * @file Scheduler.hpp
 * @brief Named, cancellable timers for the round state machine
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * The round engine never sleeps or spawns threads itself. Every delay goes
 * through a Scheduler, which is either driven by a worker thread in
 * production (ThreadScheduler) or by the test through a virtual clock
 * (ManualScheduler).
 */

#pragma once

#ifndef ASCENT_GAME_SCHEDULER_HPP
#define ASCENT_GAME_SCHEDULER_HPP

#include <Ascent/Core/Types.hpp>
#include <Ascent/Core/ErrorCodes.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Ascent::Game {

/// Handle of a scheduled timer; 0 is never issued
using TimerId = uint64_t;

/// Timer body
using TimerTask = std::function<void()>;

/**
 * @brief Abstract timer service
 *
 * Tasks are executed without any scheduler lock held, so a task may
 * schedule or cancel other timers. A cancelled timer that has not started
 * executing never runs.
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    /// Current time on this scheduler's clock
    virtual TimePoint now() const = 0;

    /**
     * @brief Run a task at an absolute time
     * @param name Diagnostic name ("countdown", "tick", ...)
     * @param due When to run; a time in the past runs as soon as possible
     * @param task Body
     */
    virtual TimerId scheduleAt(std::string name, TimePoint due, TimerTask task) = 0;

    /// Run a task after a delay from now()
    TimerId scheduleAfter(std::string name, Milliseconds delay, TimerTask task) {
        return scheduleAt(std::move(name), now() + delay, std::move(task));
    }

    /**
     * @brief Cancel a pending timer
     * @return true if the timer was pending and is now removed
     */
    virtual bool cancel(TimerId id) = 0;

    /// Names of all pending timers, earliest first
    virtual std::vector<std::string> pendingNames() const = 0;
};

// ============================================================================
// ThreadScheduler
// ============================================================================

/**
 * @brief Scheduler backed by one worker thread and the steady clock
 */
class ThreadScheduler final : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    /**
     * @brief Start the worker thread
     * @return InvalidState if already running, ThreadCreationFailed
     */
    Result<void> start();

    /**
     * @brief Stop the worker and discard pending timers
     *
     * Waits for a task that is currently executing to return.
     */
    void stop() noexcept;

    bool isRunning() const noexcept;

    TimePoint now() const override;
    TimerId scheduleAt(std::string name, TimePoint due, TimerTask task) override;
    bool cancel(TimerId id) override;
    std::vector<std::string> pendingNames() const override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// ManualScheduler
// ============================================================================

/**
 * @brief Deterministic scheduler for tests
 *
 * Time only moves when advance() is called. Tasks run on the calling
 * thread in due order, with the clock set to each task's due time while it
 * runs. With duplicate delivery enabled every task body is invoked twice,
 * which lets tests prove that timer callbacks are idempotent.
 */
class ManualScheduler final : public Scheduler {
public:
    ManualScheduler();
    ~ManualScheduler() override;

    TimePoint now() const override;
    TimerId scheduleAt(std::string name, TimePoint due, TimerTask task) override;
    bool cancel(TimerId id) override;
    std::vector<std::string> pendingNames() const override;

    /**
     * @brief Move the clock forward, running every task that becomes due
     * @return Number of task executions
     */
    size_t advance(Milliseconds delta);

    /// Run tasks that are already due without moving the clock
    size_t runDue();

    size_t pendingCount() const;

    /// Count pending timers with the given name
    size_t pendingCount(const std::string& name) const;

    void setDuplicateDelivery(bool enabled);

private:
    struct Entry {
        TimerId id;
        std::string name;
        TimerTask task;
    };

    size_t runUntil(TimePoint target);

    mutable std::mutex m_mutex;
    TimePoint m_now;
    TimerId m_nextId = 1;
    bool m_duplicate = false;
    std::multimap<TimePoint, Entry> m_pending;
};

} // namespace Ascent::Game

#endif // ASCENT_GAME_SCHEDULER_HPP
