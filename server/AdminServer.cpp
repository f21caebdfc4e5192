#include "AdminServer.hpp"

#include <Ascent/Core/Logger.hpp>
#include <Ascent/Game/AdminReports.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

using json = nlohmann::json;

namespace Ascent::Server {

namespace {

void SendJson(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(2, ' ', false, json::error_handler_t::replace), "application/json");
}

void SendError(httplib::Response& res, int status, ErrorCode code) {
    json error;
    error["status"] = "error";
    error["message"] = std::string(getErrorMessage(code));
    SendJson(res, error, status);
}

} // namespace

class AdminServer::Impl {
public:
    Impl(const Game::RoundEngine& engine,
         std::shared_ptr<const Game::PersistenceQueue> persistence,
         std::string bindAddress,
         uint16_t port)
        : m_engine(engine)
        , m_persistence(std::move(persistence))
        , m_bindAddress(std::move(bindAddress))
        , m_port(port)
    {
        RegisterRoutes();
    }

    ~Impl() {
        Stop();
    }

    Result<void> Start() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_thread.joinable()) {
            return ErrorCode::InvalidState;
        }

        if (!m_server.bind_to_port(m_bindAddress, m_port)) {
            ASCENT_LOG_ERROR_F("Admin server cannot bind %s:%u", m_bindAddress.c_str(),
                               static_cast<unsigned>(m_port));
            return ErrorCode::NetworkError;
        }

        try {
            m_thread = std::thread([this]() {
                if (!m_server.listen_after_bind()) {
                    ASCENT_LOG_ERROR("Admin server stopped unexpectedly");
                }
            });
        } catch (const std::system_error& e) {
            ASCENT_LOG_ERROR_F("Admin thread creation failed: %s", e.what());
            return ErrorCode::ThreadCreationFailed;
        }

        ASCENT_LOG_INFO_F("Admin interface listening on http://%s:%u", m_bindAddress.c_str(),
                          static_cast<unsigned>(m_port));
        return Result<void>::Success();
    }

    void Stop() noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_thread.joinable()) {
            return;
        }

        m_server.stop();
        m_thread.join();
        ASCENT_LOG_INFO("Admin interface stopped");
    }

    bool IsRunning() const {
        return m_server.is_running();
    }

private:
    void RegisterRoutes() {
        // Health check endpoint
        m_server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            json response;
            response["status"] = "ok";
            response["service"] = "Ascent Round Server";
            res.set_content(response.dump(), "application/json");
        });

        // Connected guests
        m_server.Get("/admin/users", [this](const httplib::Request&, httplib::Response& res) {
            SendJson(res, Game::usersReport(m_engine.ledger().snapshot()));
        });

        // Engine status
        m_server.Get("/api/v1/status", [this](const httplib::Request&, httplib::Response& res) {
            std::optional<Game::PersistenceStatistics> persistence;
            if (m_persistence) {
                persistence = m_persistence->statistics();
            }

            json status = Game::statusReport(m_engine.snapshot(),
                                             m_engine.hub().subscriberCount(),
                                             m_engine.hub().statistics(),
                                             persistence);
            status["server_time"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count();

            SendJson(res, status);
        });

        // Round verification
        m_server.Get("/api/v1/verify", [this](const httplib::Request& req, httplib::Response& res) {
            Game::VerifyRequest request;
            request.serverSeed = req.get_param_value("serverSeed");
            request.serverSeedHash = req.get_param_value("serverSeedHash");
            request.clientSeed = req.get_param_value("clientSeed");
            request.crashPoint = req.get_param_value("crashPoint");

            auto report = Game::verifyReport(request, m_engine.config().edgeFactor);
            if (report.isFailure()) {
                SendError(res, 400, report.error());
                return;
            }

            SendJson(res, report.value());
        });
    }

    const Game::RoundEngine& m_engine;
    std::shared_ptr<const Game::PersistenceQueue> m_persistence;
    const std::string m_bindAddress;
    const uint16_t m_port;

    httplib::Server m_server;
    std::thread m_thread;
    std::mutex m_mutex;
};

// ============================================================================
// AdminServer - Public API
// ============================================================================

AdminServer::AdminServer(const Game::RoundEngine& engine,
                         std::shared_ptr<const Game::PersistenceQueue> persistence,
                         std::string bindAddress,
                         uint16_t port)
    : m_impl(std::make_unique<Impl>(engine, std::move(persistence), std::move(bindAddress), port)) {
}

AdminServer::~AdminServer() = default;

Result<void> AdminServer::Start() {
    return m_impl->Start();
}

void AdminServer::Stop() noexcept {
    m_impl->Stop();
}

bool AdminServer::IsRunning() const {
    return m_impl->IsRunning();
}

} // namespace Ascent::Server
