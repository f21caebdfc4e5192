/**
 * @file BroadcastHub.cpp
 * @brief Fan-out of round events to connected sessions
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Game/BroadcastHub.hpp>
#include <Ascent/Core/Logger.hpp>

namespace Ascent::Game {

Result<void> BroadcastHub::subscribe(const SessionId& sessionId,
                                     std::shared_ptr<EventSink> sink,
                                     const std::vector<ServerEvent>& greeting) {
    if (!sink) {
        return ErrorCode::InvalidArgument;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto [it, inserted] = m_sinks.emplace(sessionId, Subscriber{std::move(sink)});
    if (!inserted) {
        return ErrorCode::InvalidState;
    }

    for (const auto& event : greeting) {
        deliver(sessionId, it->second, encode(event));
    }

    return Result<void>::Success();
}

bool BroadcastHub::unsubscribe(const SessionId& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sinks.erase(sessionId) > 0;
}

size_t BroadcastHub::publish(const ServerEvent& event) {
    // Serialize once for all subscribers
    const std::string frame = encode(event);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.published++;

    size_t accepted = 0;
    for (auto& [sessionId, subscriber] : m_sinks) {
        if (deliver(sessionId, subscriber, frame)) {
            ++accepted;
        }
    }
    return accepted;
}

Result<void> BroadcastHub::sendTo(const SessionId& sessionId, const ServerEvent& event) {
    const std::string frame = encode(event);

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_sinks.find(sessionId);
    if (it == m_sinks.end()) {
        return ErrorCode::SessionNotFound;
    }

    if (!deliver(sessionId, it->second, frame)) {
        return ErrorCode::NetworkError;
    }
    return Result<void>::Success();
}

size_t BroadcastHub::subscriberCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sinks.size();
}

BroadcastStatistics BroadcastHub::statistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

bool BroadcastHub::deliver(const SessionId& sessionId, Subscriber& subscriber,
                           const std::string& frame) {
    if (subscriber.sink->trySend(frame)) {
        m_stats.delivered++;
        if (subscriber.dropping) {
            subscriber.dropping = false;
            ASCENT_LOG_INFO_F("Delivery to %s resumed", sessionId.c_str());
        }
        return true;
    }

    m_stats.dropped++;

    // One warning per stall; further drops only show in the counter
    if (!subscriber.dropping) {
        subscriber.dropping = true;
        m_stats.stalls++;
        ASCENT_LOG_WARNING_F("Dropping frames for %s", sessionId.c_str());
    }
    return false;
}

} // namespace Ascent::Game
