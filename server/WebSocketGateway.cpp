#include "WebSocketGateway.hpp"

#include <Ascent/Core/Logger.hpp>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ws = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace Ascent::Server {

namespace {

// Client frames are tiny JSON objects; anything larger is refused
constexpr size_t MAX_CLIENT_FRAME = 4096;

} // namespace

class PlayerConnection;

// Live connections, so Stop() can close the ones still open
class ConnectionTracker {
public:
    void Add(const std::shared_ptr<PlayerConnection>& connection) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connections[connection.get()] = connection;
    }

    void Remove(const PlayerConnection* connection) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connections.erase(connection);
    }

    std::vector<std::shared_ptr<PlayerConnection>> Snapshot() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::shared_ptr<PlayerConnection>> live;
        live.reserve(m_connections.size());
        for (const auto& [key, weak] : m_connections) {
            if (auto connection = weak.lock()) {
                live.push_back(std::move(connection));
            }
        }
        return live;
    }

    size_t Count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_connections.size();
    }

private:
    mutable std::mutex m_mutex;
    std::map<const PlayerConnection*, std::weak_ptr<PlayerConnection>> m_connections;
};

// ============================================================================
// PlayerConnection
// ============================================================================

class PlayerConnection : public Game::EventSink,
                         public std::enable_shared_from_this<PlayerConnection> {
public:
    PlayerConnection(tcp::socket&& socket,
                     Game::RoundEngine& engine,
                     size_t queueDepth,
                     std::shared_ptr<ConnectionTracker> tracker)
        : m_ws(std::move(socket))
        , m_engine(engine)
        , m_queueDepth(queueDepth == 0 ? 1 : queueDepth)
        , m_tracker(std::move(tracker))
    {
        beast::error_code ec;
        auto remote = beast::get_lowest_layer(m_ws).socket().remote_endpoint(ec);
        m_peer = ec ? std::string("unknown") : remote.address().to_string();
    }

    void Run() {
        net::dispatch(m_ws.get_executor(),
                      beast::bind_front_handler(&PlayerConnection::OnRun, shared_from_this()));
    }

    // Called by the hub with its lock held: enqueue only
    bool trySend(const std::string& frame) noexcept override {
        try {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_closed || m_outbox.size() >= m_queueDepth) {
                return false;
            }

            m_outbox.push_back(frame);

            if (!m_writing) {
                m_writing = true;
                net::post(m_ws.get_executor(),
                          beast::bind_front_handler(&PlayerConnection::WriteNext, shared_from_this()));
            }
            return true;
        } catch (const std::exception& e) {
            ASCENT_LOG_WARNING_F("Queueing frame for %s failed: %s", m_peer.c_str(), e.what());
            return false;
        }
    }

    // Close from outside the I/O threads once they have been joined
    void Abort() {
        Shutdown();
        beast::error_code ec;
        beast::get_lowest_layer(m_ws).socket().close(ec);
        if (ec) {
            ASCENT_LOG_DEBUG_F("Closing socket of %s: %s", m_peer.c_str(), ec.message().c_str());
        }
    }

private:
    void OnRun() {
        m_ws.set_option(ws::stream_base::timeout::suggested(beast::role_type::server));
        m_ws.set_option(ws::stream_base::decorator([](ws::response_type& res) {
            res.set(http::field::server, "ascent-server");
        }));
        m_ws.read_message_max(MAX_CLIENT_FRAME);

        m_ws.async_accept(
            beast::bind_front_handler(&PlayerConnection::OnAccept, shared_from_this()));
    }

    void OnAccept(beast::error_code ec) {
        if (ec) {
            ASCENT_LOG_WARNING_F("WebSocket handshake with %s failed: %s",
                                 m_peer.c_str(), ec.message().c_str());
            m_tracker->Remove(this);
            return;
        }

        auto session = m_engine.connect(shared_from_this());
        if (session.isFailure()) {
            ASCENT_LOG_ERROR_F("Cannot open a session for %s: %s", m_peer.c_str(),
                               std::string(getErrorMessage(session.error())).c_str());
            m_tracker->Remove(this);
            m_ws.async_close(ws::close_code::try_again_later,
                             beast::bind_front_handler(&PlayerConnection::OnClose, shared_from_this()));
            return;
        }

        m_sessionId = std::move(session).value();
        ASCENT_LOG_INFO_F("Player %s connected from %s", m_sessionId.c_str(), m_peer.c_str());

        DoRead();
    }

    void DoRead() {
        m_ws.async_read(m_buffer,
                        beast::bind_front_handler(&PlayerConnection::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec == ws::error::closed) {
            Shutdown();
            return;
        }
        if (ec) {
            ASCENT_LOG_DEBUG_F("Read from %s ended: %s", m_sessionId.c_str(), ec.message().c_str());
            Shutdown();
            return;
        }

        m_engine.handleMessage(m_sessionId, beast::buffers_to_string(m_buffer.data()));
        m_buffer.consume(m_buffer.size());

        DoRead();
    }

    void WriteNext() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed || m_outbox.empty()) {
                m_writing = false;
                return;
            }
            m_current = std::move(m_outbox.front());
            m_outbox.pop_front();
        }

        m_ws.text(true);
        m_ws.async_write(net::buffer(m_current),
                         beast::bind_front_handler(&PlayerConnection::OnWrite, shared_from_this()));
    }

    void OnWrite(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) {
            ASCENT_LOG_DEBUG_F("Write to %s failed: %s", m_sessionId.c_str(), ec.message().c_str());
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_writing = false;
            }
            Shutdown();
            return;
        }

        WriteNext();
    }

    void OnClose(beast::error_code ec) {
        if (ec) {
            ASCENT_LOG_DEBUG_F("Close handshake with %s failed: %s", m_peer.c_str(), ec.message().c_str());
        }
    }

    // Leave the engine; safe to call more than once
    void Shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return;
            }
            m_closed = true;
            m_outbox.clear();
        }

        if (!m_sessionId.empty()) {
            m_engine.disconnect(m_sessionId);
            ASCENT_LOG_INFO_F("Player %s disconnected", m_sessionId.c_str());
        }
        m_tracker->Remove(this);
    }

    ws::stream<beast::tcp_stream> m_ws;
    beast::flat_buffer m_buffer;
    Game::RoundEngine& m_engine;
    const size_t m_queueDepth;
    std::shared_ptr<ConnectionTracker> m_tracker;
    std::string m_peer;
    Game::SessionId m_sessionId;

    std::mutex m_mutex;
    std::deque<std::string> m_outbox;
    std::string m_current;      // Frame being written, owned by the strand
    bool m_writing = false;
    bool m_closed = false;
};

// ============================================================================
// WebSocketGateway::Impl
// ============================================================================

class WebSocketGateway::Impl {
public:
    Impl(Game::RoundEngine& engine, std::string bindAddress, uint16_t port,
         size_t queueDepth, size_t threadCount)
        : m_engine(engine)
        , m_bindAddress(std::move(bindAddress))
        , m_port(port)
        , m_queueDepth(queueDepth)
        , m_threadCount(threadCount == 0 ? 1 : threadCount)
        , m_acceptor(m_ioc)
        , m_tracker(std::make_shared<ConnectionTracker>())
    {
    }

    ~Impl() {
        Stop();
    }

    Result<void> Start() {
        std::lock_guard<std::mutex> lock(m_mutex);

        // The io_context is not restarted once stopped
        if (m_running || m_stopped) {
            return ErrorCode::InvalidState;
        }

        beast::error_code ec;
        const auto address = net::ip::make_address(m_bindAddress, ec);
        if (ec) {
            ASCENT_LOG_ERROR_F("Invalid bind address '%s': %s", m_bindAddress.c_str(), ec.message().c_str());
            return ErrorCode::InvalidArgument;
        }

        const tcp::endpoint endpoint(address, m_port);

        m_acceptor.open(endpoint.protocol(), ec);
        if (!ec) {
            m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            m_acceptor.bind(endpoint, ec);
        }
        if (!ec) {
            m_acceptor.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            ASCENT_LOG_ERROR_F("Cannot listen on %s:%u: %s", m_bindAddress.c_str(),
                               static_cast<unsigned>(m_port), ec.message().c_str());
            beast::error_code ignored;
            m_acceptor.close(ignored);
            return ErrorCode::NetworkError;
        }

        DoAccept();

        try {
            for (size_t i = 0; i < m_threadCount; ++i) {
                m_threads.emplace_back(&Impl::RunLoop, this);
            }
        } catch (const std::system_error& e) {
            ASCENT_LOG_ERROR_F("Gateway thread creation failed: %s", e.what());
            m_ioc.stop();
            JoinThreads();
            beast::error_code ignored;
            m_acceptor.close(ignored);
            m_stopped = true;
            return ErrorCode::ThreadCreationFailed;
        }

        m_running = true;
        ASCENT_LOG_INFO_F("WebSocket gateway listening on %s:%u", m_bindAddress.c_str(),
                          static_cast<unsigned>(LocalPortLocked()));
        return Result<void>::Success();
    }

    void Stop() noexcept {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                return;
            }
            m_running = false;
            m_stopped = true;
        }

        m_ioc.stop();
        JoinThreads();

        beast::error_code ec;
        m_acceptor.close(ec);

        try {
            for (const auto& connection : m_tracker->Snapshot()) {
                connection->Abort();
            }
        } catch (const std::exception& e) {
            ASCENT_LOG_ERROR_F("Closing player connections failed: %s", e.what());
        }

        ASCENT_LOG_INFO("WebSocket gateway stopped");
    }

    bool IsRunning() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

    uint16_t LocalPort() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return LocalPortLocked();
    }

    size_t GetConnectionCount() const {
        return m_tracker->Count();
    }

private:
    uint16_t LocalPortLocked() const {
        if (!m_acceptor.is_open()) {
            return m_port;
        }
        beast::error_code ec;
        const auto endpoint = m_acceptor.local_endpoint(ec);
        return ec ? m_port : endpoint.port();
    }

    void DoAccept() {
        m_acceptor.async_accept(net::make_strand(m_ioc),
                                beast::bind_front_handler(&Impl::OnAccept, this));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }

        if (ec) {
            ASCENT_LOG_WARNING_F("Accept failed: %s", ec.message().c_str());
        } else {
            auto connection = std::make_shared<PlayerConnection>(
                std::move(socket), m_engine, m_queueDepth, m_tracker);
            m_tracker->Add(connection);
            connection->Run();
        }

        if (m_acceptor.is_open()) {
            DoAccept();
        }
    }

    void RunLoop() {
        for (;;) {
            try {
                m_ioc.run();
                return;
            } catch (const std::exception& e) {
                ASCENT_LOG_ERROR_F("Gateway handler threw: %s", e.what());
            }
        }
    }

    void JoinThreads() noexcept {
        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        m_threads.clear();
    }

    Game::RoundEngine& m_engine;
    const std::string m_bindAddress;
    const uint16_t m_port;
    const size_t m_queueDepth;
    const size_t m_threadCount;

    net::io_context m_ioc;
    tcp::acceptor m_acceptor;
    std::shared_ptr<ConnectionTracker> m_tracker;
    std::vector<std::thread> m_threads;

    mutable std::mutex m_mutex;
    bool m_running = false;
    bool m_stopped = false;
};

// ============================================================================
// WebSocketGateway - Public API
// ============================================================================

WebSocketGateway::WebSocketGateway(Game::RoundEngine& engine,
                                   std::string bindAddress,
                                   uint16_t port,
                                   size_t queueDepth,
                                   size_t threadCount)
    : m_impl(std::make_unique<Impl>(engine, std::move(bindAddress), port, queueDepth, threadCount)) {
}

WebSocketGateway::~WebSocketGateway() = default;

Result<void> WebSocketGateway::Start() {
    return m_impl->Start();
}

void WebSocketGateway::Stop() noexcept {
    m_impl->Stop();
}

bool WebSocketGateway::IsRunning() const {
    return m_impl->IsRunning();
}

uint16_t WebSocketGateway::LocalPort() const {
    return m_impl->LocalPort();
}

size_t WebSocketGateway::GetConnectionCount() const {
    return m_impl->GetConnectionCount();
}

} // namespace Ascent::Server
