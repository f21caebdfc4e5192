/**
 * @file BroadcastHub.hpp
 * @brief Fan-out of round events to connected sessions
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#pragma once

#ifndef ASCENT_GAME_BROADCAST_HUB_HPP
#define ASCENT_GAME_BROADCAST_HUB_HPP

#include <Ascent/Core/ErrorCodes.hpp>
#include <Ascent/Game/GameTypes.hpp>
#include <Ascent/Game/Protocol.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Ascent::Game {

/**
 * @brief Outbound side of one connection
 *
 * trySend() is called with the hub lock held and must only enqueue; a
 * full or closed connection returns false and the frame is counted as
 * dropped.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual bool trySend(const std::string& frame) noexcept = 0;
};

/**
 * @brief Delivery counters
 */
struct BroadcastStatistics {
    uint64_t published = 0;    ///< Events passed to publish()
    uint64_t delivered = 0;    ///< Frames accepted by a sink
    uint64_t dropped = 0;      ///< Frames refused by a sink
    uint64_t stalls = 0;       ///< Times a sink went from accepting to refusing
};

/**
 * @brief Registry of subscribed sessions
 *
 * Every frame is delivered under one lock, so all subscribers observe
 * events in publish order and a greeting is never interleaved with a
 * concurrent broadcast.
 */
class BroadcastHub {
public:
    BroadcastHub() = default;

    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    /**
     * @brief Register a session and send it a greeting
     * @param greeting Events delivered to this session only, before any
     *        later broadcast
     * @return InvalidArgument for a null sink, InvalidState if the id is
     *         already subscribed
     */
    Result<void> subscribe(const SessionId& sessionId,
                           std::shared_ptr<EventSink> sink,
                           const std::vector<ServerEvent>& greeting = {});

    /**
     * @return true if the session was subscribed
     */
    bool unsubscribe(const SessionId& sessionId);

    /**
     * @brief Deliver an event to every subscriber
     * @return Number of sinks that accepted the frame
     */
    size_t publish(const ServerEvent& event);

    /**
     * @brief Deliver an event to one subscriber
     * @return SessionNotFound, or NetworkError if the sink refused it
     */
    Result<void> sendTo(const SessionId& sessionId, const ServerEvent& event);

    size_t subscriberCount() const;

    BroadcastStatistics statistics() const;

private:
    struct Subscriber {
        std::shared_ptr<EventSink> sink;
        bool dropping = false;    ///< Last frame was refused
    };

    bool deliver(const SessionId& sessionId, Subscriber& subscriber, const std::string& frame);

    mutable std::mutex m_mutex;
    std::map<SessionId, Subscriber> m_sinks;
    BroadcastStatistics m_stats;
};

} // namespace Ascent::Game

#endif // ASCENT_GAME_BROADCAST_HUB_HPP
