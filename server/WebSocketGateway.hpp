#pragma once

#include <Ascent/Core/ErrorCodes.hpp>
#include <Ascent/Game/RoundEngine.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace Ascent::Server {

// Player-facing WebSocket listener.
//
// Each accepted connection opens a guest session on the engine and is
// subscribed as its event sink. Frames are written from the connection's
// strand; at most queueDepth frames wait per connection and anything beyond
// that is dropped for that player only.
class WebSocketGateway {
public:
    WebSocketGateway(Game::RoundEngine& engine,
                     std::string bindAddress,
                     uint16_t port,
                     size_t queueDepth,
                     size_t threadCount = 1);
    ~WebSocketGateway();

    WebSocketGateway(const WebSocketGateway&) = delete;
    WebSocketGateway& operator=(const WebSocketGateway&) = delete;

    // Bind, listen and start the I/O threads.
    // NetworkError if the address cannot be bound, InvalidState if running.
    Result<void> Start();

    // Close the listener and every connection, then join the I/O threads.
    void Stop() noexcept;

    bool IsRunning() const;

    // Port actually bound (useful when constructed with port 0)
    uint16_t LocalPort() const;

    size_t GetConnectionCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Ascent::Server
