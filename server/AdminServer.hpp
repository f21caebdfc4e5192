#pragma once

#include <Ascent/Core/ErrorCodes.hpp>
#include <Ascent/Game/RoundEngine.hpp>
#include <Ascent/Game/RoundStore.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace Ascent::Server {

// Read-only HTTP interface for operators and auditors:
//
//   GET /health            liveness check
//   GET /admin/users       balances and wagers of connected guests
//   GET /api/v1/status     engine phase, round, delivery counters
//   GET /api/v1/verify     recompute a revealed round
class AdminServer {
public:
    AdminServer(const Game::RoundEngine& engine,
                std::shared_ptr<const Game::PersistenceQueue> persistence,
                std::string bindAddress,
                uint16_t port);
    ~AdminServer();

    AdminServer(const AdminServer&) = delete;
    AdminServer& operator=(const AdminServer&) = delete;

    // Bind and serve on a background thread
    Result<void> Start();

    void Stop() noexcept;

    bool IsRunning() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Ascent::Server
