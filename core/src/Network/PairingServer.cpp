// PairingServer.cpp — TCP сервер для QR pairing и push snapshot'ов (без TLS)

#include "meterlink/Network/PairingServer.h"
#include "meterlink/Network/ConnectionRegistry.h"
#include "meterlink/Network/ConnectionStateMachine.h"
#include "meterlink/PairingTokenStore.h"
#include "meterlink/Crypto.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    using socket_t = SOCKET;
    #define SOCKET_INVALID INVALID_SOCKET
    #define CLOSE_SOCKET closesocket
    #define SOCKET_ERROR_CODE WSAGetLastError()
    #define SHUTDOWN_BOTH SD_BOTH
    #define MSG_NOSIGNAL 0
#else
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <errno.h>
    using socket_t = int;
    #define SOCKET_INVALID (-1)
    #define CLOSE_SOCKET ::close
    #define SOCKET_ERROR_CODE errno
    #define SHUTDOWN_BOTH SHUT_RDWR
#endif

namespace MeterLink {

namespace {

void setSocketTimeout(socket_t sock, int option, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    DWORD ms = static_cast<DWORD>(timeout.count());
    setsockopt(sock, SOL_SOCKET, option, reinterpret_cast<const char*>(&ms), sizeof(ms));
#else
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
    setsockopt(sock, SOL_SOCKET, option, &tv, sizeof(tv));
#endif
}

bool isTimeoutError(int code) {
#ifdef _WIN32
    return code == WSAETIMEDOUT || code == WSAEWOULDBLOCK;
#else
    return code == EAGAIN || code == EWOULDBLOCK;
#endif
}

bool isInterrupted(int code) {
#ifdef _WIN32
    return code == WSAEINTR;
#else
    return code == EINTR;
#endif
}

// ═══════════════════════════════════════════════════════════
// Session — одно принятое соединение
// ═══════════════════════════════════════════════════════════

struct Session {
    const std::string id;
    const socket_t sock;
    const std::string address;

    std::mutex eventMutex;                        // Сериализует переходы и их эффекты
    ConnectionState state = ConnectionState::Connecting;

    std::mutex sendMutex;                         // Один писатель в сокет
    std::atomic<bool> closing{false};
    std::atomic<bool> finished{false};            // Поток приёма завершился
    std::thread thread;

    Session(std::string sessionId, socket_t s, std::string peerAddress)
        : id(std::move(sessionId)), sock(s), address(std::move(peerAddress)) {}

    // Дескриптор закрывается только здесь: пока кто-то держит Session,
    // номер fd не может быть переиспользован
    ~Session() {
        if (sock != SOCKET_INVALID) {
            CLOSE_SOCKET(sock);
        }
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
};

} // namespace

// ═══════════════════════════════════════════════════════════
// PairingServer::Impl
// ═══════════════════════════════════════════════════════════

class PairingServer::Impl {
public:
    Impl(PairingServerConfig config, std::shared_ptr<AddressResolver> resolver)
        : m_config(std::move(config))
        , m_resolver(resolver ? std::move(resolver) : std::make_shared<InterfaceAddressResolver>())
        , m_tokens(m_config.tokenLifetime, m_config.purgeGrace) {
#ifdef _WIN32
        WSADATA wsaData;
        if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
            spdlog::error("PairingServer: WSAStartup failed");
        }
#endif
        if (m_config.hostDisplayName.empty()) {
            m_config.hostDisplayName = getDefaultMachineName();
        }
    }

    ~Impl() {
        stop();
        joinLeftoverSessions();
#ifdef _WIN32
        WSACleanup();
#endif
    }

    // ═══════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════

    bool start() {
        bool started = false;
        {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            if (m_running) {
                return true;
            }
            started = startLocked();
        }

        if (started) {
            notifyRunningChanged(true);
        } else {
            notifyError(getLastError(), getLastErrorMessage());
        }
        return started;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            if (!m_running) {
                return;
            }
            stopLocked();
        }
        notifyRunningChanged(false);
    }

    // Вызов из callback'а: текущий поток принадлежит одной из сессий
    bool onSessionThread() const {
        auto thisThread = std::this_thread::get_id();
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        for (const auto& [id, session] : m_sessions) {
            if (session->thread.get_id() == thisThread) {
                return true;
            }
        }
        return false;
    }

    // Владелец уничтожен из callback'а. Impl удаляет себя сам,
    // когда поток этой сессии выйдет из receiveLoop
    void orphan() {
        m_orphanOwner = std::this_thread::get_id();
        m_orphaned = true;
    }

    bool isRunning() const { return m_running; }
    uint16_t getPort() const { return m_port; }
    const PairingServerConfig& config() const { return m_config; }

    // ═══════════════════════════════════════════════════════════
    // Credentials
    // ═══════════════════════════════════════════════════════════

    std::optional<PairingQRPayload> issuePairingCredential() {
        if (!m_running) {
            setLastError(PairingError::ServerNotRunning, "Pairing server is not running");
            notifyError(PairingError::ServerNotRunning, "Pairing server is not running");
            return std::nullopt;
        }

        std::string host = m_resolver->resolve();

        std::lock_guard<std::mutex> lock(m_credentialMutex);

        // Latest wins: старый QR перестаёт работать
        if (m_currentCredential) {
            m_tokens.invalidate(m_currentCredential->token);
            m_currentCredential.reset();
        }

        auto token = m_tokens.issue();

        PairingQRPayload payload;
        payload.host = host;
        payload.port = m_port;
        payload.token = token.value;
        payload.expiresAt = token.expiresAt;
        payload.machineName = m_config.hostDisplayName;

        m_currentCredential = payload;

        spdlog::info("PairingServer: Issued pairing credential for {}:{}, valid {}s",
                     payload.host, payload.port,
                     std::chrono::duration_cast<std::chrono::seconds>(m_config.tokenLifetime).count());
        return payload;
    }

    void invalidateCurrentCredential() {
        std::lock_guard<std::mutex> lock(m_credentialMutex);
        if (m_currentCredential) {
            m_tokens.invalidate(m_currentCredential->token);
            m_currentCredential.reset();
            spdlog::debug("PairingServer: Current credential revoked");
        }
    }

    std::optional<PairingQRPayload> currentCredential() const {
        std::lock_guard<std::mutex> lock(m_credentialMutex);
        return m_currentCredential;
    }

    // ═══════════════════════════════════════════════════════════
    // Broadcast
    // ═══════════════════════════════════════════════════════════

    size_t broadcastJson(const std::string& snapshotJson) {
        if (!m_running) {
            spdlog::debug("PairingServer: broadcast while stopped, ignored");
            return 0;
        }

        PairingMessage msg(MessageType::Snapshot, snapshotJson);
        auto frame = MessageSerializer::serialize(msg);
        if (frame.empty()) {
            spdlog::warn("PairingServer: Snapshot is not serializable, broadcast skipped");
            return 0;
        }

        std::vector<std::shared_ptr<Session>> targets;
        {
            auto ids = m_registry.authenticatedIds();
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            for (const auto& id : ids) {
                auto it = m_sessions.find(id);
                if (it != m_sessions.end()) {
                    targets.push_back(it->second);
                }
            }
        }

        size_t delivered = 0;
        for (const auto& session : targets) {
            if (sendFrame(*session, frame)) {
                ++delivered;
            }
        }

        spdlog::debug("PairingServer: Snapshot delivered to {}/{} peers", delivered, targets.size());
        return delivered;
    }

    // ═══════════════════════════════════════════════════════════
    // Devices
    // ═══════════════════════════════════════════════════════════

    bool disconnect(const std::string& deviceId) {
        if (!m_registry.contains(deviceId)) {
            return false;
        }

        std::shared_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            auto it = m_sessions.find(deviceId);
            if (it == m_sessions.end()) {
                return false;
            }
            session = it->second;
        }

        spdlog::info("PairingServer: Disconnecting {}", deviceId);
        handleEvent(*session, ConnectionEvent::LocalDisconnect);
        return true;
    }

    void disconnectAll() {
        std::vector<std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            for (const auto& [id, session] : m_sessions) {
                sessions.push_back(session);
            }
        }

        spdlog::info("PairingServer: Disconnecting all ({} connections)", sessions.size());
        for (const auto& session : sessions) {
            handleEvent(*session, ConnectionEvent::LocalDisconnect);
        }
    }

    std::vector<ConnectedDevice> connectedDevices() const { return m_registry.connectedDevices(); }
    size_t connectionCount() const { return m_registry.connectionCount(); }

    // ═══════════════════════════════════════════════════════════
    // Errors & callbacks
    // ═══════════════════════════════════════════════════════════

    PairingError getLastError() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastError;
    }

    std::string getLastErrorMessage() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastErrorMessage;
    }

    void onDeviceConnected(DeviceCallback cb) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onDeviceConnected = std::move(cb);
    }

    void onDeviceDisconnected(DeviceCallback cb) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onDeviceDisconnected = std::move(cb);
    }

    void onRunningChanged(RunningCallback cb) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onRunningChanged = std::move(cb);
    }

    void onError(ErrorCallback cb) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onError = std::move(cb);
    }

private:
    // Уведомление, отложенное до снятия блокировок
    struct DeviceNotice {
        bool connected;
        ConnectedDevice device;
    };

    PairingServerConfig m_config;
    std::shared_ptr<AddressResolver> m_resolver;
    PairingTokenStore m_tokens;
    ConnectionRegistry m_registry;

    std::mutex m_lifecycleMutex;
    std::atomic<bool> m_running{false};
    std::atomic<uint16_t> m_port{0};
    socket_t m_serverSocket = SOCKET_INVALID;
    std::thread m_acceptThread;

    // Ожидание grace-задержки прерывается stop()
    std::mutex m_stopMutex;
    std::condition_variable m_stopCv;

    mutable std::mutex m_sessionsMutex;
    std::map<std::string, std::shared_ptr<Session>> m_sessions;

    std::thread::id m_orphanOwner;
    std::atomic<bool> m_orphaned{false};

    mutable std::mutex m_credentialMutex;
    std::optional<PairingQRPayload> m_currentCredential;

    mutable std::mutex m_errorMutex;
    PairingError m_lastError = PairingError::None;
    std::string m_lastErrorMessage;

    std::mutex m_callbackMutex;
    DeviceCallback m_onDeviceConnected;
    DeviceCallback m_onDeviceDisconnected;
    RunningCallback m_onRunningChanged;
    ErrorCallback m_onError;

    void setLastError(PairingError code, const std::string& message) {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastError = code;
        m_lastErrorMessage = message;
    }

    bool failStart(PairingError code, const std::string& message) {
        setLastError(code, message);
        spdlog::error("PairingServer: {}", message);
        if (m_serverSocket != SOCKET_INVALID) {
            CLOSE_SOCKET(m_serverSocket);
            m_serverSocket = SOCKET_INVALID;
        }
        return false;
    }

    bool startLocked() {
        if (!m_config.isValid()) {
            return failStart(PairingError::InvalidConfig, "Invalid server configuration");
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(m_config.port);
        if (inet_pton(AF_INET, m_config.bindAddress.c_str(), &addr.sin_addr) != 1) {
            return failStart(PairingError::InvalidConfig,
                             "Invalid bind address: " + m_config.bindAddress);
        }

        m_serverSocket = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (m_serverSocket == SOCKET_INVALID) {
            return failStart(PairingError::SocketFailed,
                             "Failed to create socket: " + std::to_string(SOCKET_ERROR_CODE));
        }

        int opt = 1;
#ifdef _WIN32
        setsockopt(m_serverSocket, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<const char*>(&opt), sizeof(opt));
#else
        setsockopt(m_serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#endif

        if (bind(m_serverSocket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            return failStart(PairingError::BindFailed,
                             "Failed to bind: " + std::to_string(SOCKET_ERROR_CODE));
        }

        // Фактический порт (если был 0)
        socklen_t addrLen = sizeof(addr);
        if (getsockname(m_serverSocket, reinterpret_cast<sockaddr*>(&addr), &addrLen) < 0) {
            return failStart(PairingError::BindFailed,
                             "getsockname failed: " + std::to_string(SOCKET_ERROR_CODE));
        }

        if (listen(m_serverSocket, m_config.listenBacklog) < 0) {
            return failStart(PairingError::ListenFailed,
                             "Failed to listen: " + std::to_string(SOCKET_ERROR_CODE));
        }

        // Каждый запуск начинается с чистого состояния
        m_registry.clear();
        m_tokens.invalidateAll();
        setLastError(PairingError::None, "");

        m_port = ntohs(addr.sin_port);
        m_running = true;
        m_acceptThread = std::thread([this]() { acceptLoop(); });

        spdlog::info("PairingServer: Started on {}:{}", m_config.bindAddress, m_port.load());
        return true;
    }

    void stopLocked() {
        {
            std::lock_guard<std::mutex> lock(m_stopMutex);
            m_running = false;
        }
        m_stopCv.notify_all();

        // shutdown() будит accept(); закрываем после join
        if (m_serverSocket != SOCKET_INVALID) {
            shutdown(m_serverSocket, SHUTDOWN_BOTH);
        }
        if (m_acceptThread.joinable()) {
            m_acceptThread.join();
        }
        if (m_serverSocket != SOCKET_INVALID) {
            CLOSE_SOCKET(m_serverSocket);
            m_serverSocket = SOCKET_INVALID;
        }

        std::vector<std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            for (const auto& [id, session] : m_sessions) {
                sessions.push_back(session);
            }
        }

        for (const auto& session : sessions) {
            closeTransport(*session);
        }

        auto thisThread = std::this_thread::get_id();
        for (const auto& session : sessions) {
            if (session->thread.joinable() && session->thread.get_id() != thisThread) {
                session->thread.join();
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            for (auto it = m_sessions.begin(); it != m_sessions.end();) {
                // stop() из callback'а: свой поток останется до следующего reap
                if (it->second->thread.joinable()) {
                    ++it;
                } else {
                    it = m_sessions.erase(it);
                }
            }
        }

        m_registry.clear();
        m_tokens.invalidateAll();
        {
            std::lock_guard<std::mutex> lock(m_credentialMutex);
            m_currentCredential.reset();
        }
        m_port = 0;

        spdlog::info("PairingServer: Stopped");
    }

    // ═══════════════════════════════════════════════════════════
    // Accept / receive
    // ═══════════════════════════════════════════════════════════

    void acceptLoop() {
        while (m_running) {
            sockaddr_in clientAddr{};
            socklen_t clientAddrLen = sizeof(clientAddr);

            socket_t clientSocket = accept(m_serverSocket,
                reinterpret_cast<sockaddr*>(&clientAddr), &clientAddrLen);

            if (clientSocket == SOCKET_INVALID) {
                if (!m_running) {
                    break;
                }
                int code = SOCKET_ERROR_CODE;
                if (!isInterrupted(code)) {
                    spdlog::warn("PairingServer: accept() failed: {}", code);
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                continue;
            }

            if (!m_running) {
                CLOSE_SOCKET(clientSocket);
                break;
            }

            char clientIp[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &clientAddr.sin_addr, clientIp, sizeof(clientIp));
            std::string address = std::string(clientIp) + ":" + std::to_string(ntohs(clientAddr.sin_port));

            std::string id;
            try {
                id = Crypto::generateUUID();
            } catch (const std::runtime_error& e) {
                spdlog::error("PairingServer: Rejecting {}: {}", address, e.what());
                CLOSE_SOCKET(clientSocket);
                continue;
            }

            setSocketTimeout(clientSocket, SO_SNDTIMEO, m_config.sendTimeout);
            if (m_config.idleTimeout.count() > 0) {
                setSocketTimeout(clientSocket, SO_RCVTIMEO, m_config.idleTimeout);
            }

            auto session = std::make_shared<Session>(id, clientSocket, address);
            spdlog::info("PairingServer: Connection {} from {}", id, address);

            reapFinishedSessions();
            {
                std::lock_guard<std::mutex> lock(m_sessionsMutex);
                m_sessions[id] = session;
            }

            handleEvent(*session, ConnectionEvent::Accepted);
            Session* raw = session.get();
            // Под mutex: onSessionThread() читает thread из чужого потока
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            session->thread = std::thread([this, raw]() {
                receiveLoop(*raw);
                if (m_orphaned && m_orphanOwner == std::this_thread::get_id()) {
                    delete this;
                }
            });
        }
    }

    // stop() из callback'а оставляет поток своей сессии; дожидаемся его здесь
    void joinLeftoverSessions() {
        auto thisThread = std::this_thread::get_id();
        std::vector<std::shared_ptr<Session>> leftovers;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            for (const auto& [id, session] : m_sessions) {
                leftovers.push_back(session);
            }
        }

        for (const auto& session : leftovers) {
            if (!session->thread.joinable()) {
                continue;
            }
            if (session->thread.get_id() == thisThread) {
                // Удаление из orphan-пути: поток завершится сразу после delete
                session->thread.detach();
            } else {
                session->thread.join();
            }
        }
    }

    // Join sessions whose receive thread has returned. Never joins itself.
    void reapFinishedSessions() {
        std::vector<std::shared_ptr<Session>> finished;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            for (auto it = m_sessions.begin(); it != m_sessions.end();) {
                if (it->second->finished) {
                    finished.push_back(it->second);
                    it = m_sessions.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (const auto& session : finished) {
            if (session->thread.joinable()) {
                session->thread.join();
            }
        }
    }

    void receiveLoop(Session& session) {
        std::vector<uint8_t> buffer(16 * 1024);
        std::vector<uint8_t> accumulated;
        ConnectionEvent closeEvent = ConnectionEvent::TransportClosed;

        while (m_running && !session.closing) {
            int received = recv(session.sock, reinterpret_cast<char*>(buffer.data()),
                                static_cast<int>(buffer.size()), 0);

            if (received == 0) {
                spdlog::info("PairingServer: {} closed by peer", session.id);
                break;
            }
            if (received < 0) {
                int code = SOCKET_ERROR_CODE;
                if (isInterrupted(code)) {
                    continue;
                }
                if (isTimeoutError(code) && m_config.idleTimeout.count() > 0 && !session.closing) {
                    spdlog::info("PairingServer: {} idle for {}ms, closing",
                                 session.id, m_config.idleTimeout.count());
                    closeEvent = ConnectionEvent::IdleTimeout;
                } else if (!session.closing) {
                    spdlog::warn("PairingServer: recv failed for {}: {}", session.id, code);
                }
                break;
            }

            accumulated.insert(accumulated.end(), buffer.begin(), buffer.begin() + received);

            bool violated = false;
            while (!accumulated.empty()) {
                if (MessageSerializer::isHeaderCorrupt(accumulated.data(), accumulated.size())) {
                    spdlog::warn("PairingServer: Framing violation from {}, closing", session.id);
                    violated = true;
                    break;
                }
                size_t frameSize = MessageSerializer::getFrameSize(accumulated.data(), accumulated.size());
                if (frameSize == 0 || frameSize > accumulated.size()) {
                    break;  // Ждём остаток кадра
                }

                handleFrame(session, accumulated.data(), frameSize);
                accumulated.erase(accumulated.begin(), accumulated.begin() + frameSize);

                if (session.closing) {
                    break;
                }
            }

            if (violated) {
                break;
            }
        }

        handleEvent(session, closeEvent);
        session.finished = true;
    }

    void handleFrame(Session& session, const uint8_t* data, size_t size) {
        auto msg = MessageSerializer::deserialize(data, size);
        if (!msg) {
            spdlog::debug("PairingServer: Dropped malformed envelope from {}", session.id);
            return;
        }

        spdlog::debug("PairingServer: {} <- {}", session.id, messageTypeName(msg->type));

        switch (msg->type) {
            case MessageType::Auth: {
                std::optional<AuthPayload> auth;
                if (msg->payload) {
                    auth = AuthPayload::fromJson(*msg->payload);
                }
                if (!auth) {
                    handleEvent(session, ConnectionEvent::AuthMalformed);
                } else {
                    handleEvent(session, ConnectionEvent::AuthRequested, &*auth);
                }
                break;
            }
            case MessageType::Ping:
                handleEvent(session, ConnectionEvent::PingReceived);
                break;
            case MessageType::Disconnect:
                handleEvent(session, ConnectionEvent::DisconnectReceived);
                break;
            default:
                handleEvent(session, ConnectionEvent::UnexpectedMessage);
                break;
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Events & effects
    // ═══════════════════════════════════════════════════════════

    void handleEvent(Session& session, ConnectionEvent event, const AuthPayload* auth = nullptr) {
        std::vector<DeviceNotice> notices;
        {
            std::lock_guard<std::mutex> lock(session.eventMutex);
            std::optional<ConnectionEvent> pending = event;
            while (pending) {
                auto current = *pending;
                pending.reset();

                auto transition = ConnectionStateMachine::next(session.state, current);
                if (transition.state != session.state) {
                    spdlog::debug("PairingServer: {} {} -> {} on {}", session.id,
                                  connectionStateToString(session.state),
                                  connectionStateToString(transition.state),
                                  connectionEventToString(current));
                }
                session.state = transition.state;

                for (auto effect : transition.effects) {
                    auto followUp = applyEffect(session, effect, auth, notices);
                    if (followUp) {
                        pending = followUp;
                    }
                }
            }
        }

        for (const auto& notice : notices) {
            if (notice.connected) {
                notifyDeviceConnected(notice.device);
            } else {
                notifyDeviceDisconnected(notice.device);
            }
        }
    }

    std::optional<ConnectionEvent> applyEffect(Session& session, ConnectionEffect effect,
                                               const AuthPayload* auth,
                                               std::vector<DeviceNotice>& notices) {
        switch (effect) {
            case ConnectionEffect::Register:
                m_registry.add(session.id);
                break;

            case ConnectionEffect::ValidateToken: {
                bool accepted = auth && m_tokens.validateAndConsume(auth->token);
                if (!accepted) {
                    spdlog::warn("PairingServer: Auth rejected for {} ({})", session.id, session.address);
                }
                return accepted ? ConnectionEvent::TokenAccepted : ConnectionEvent::TokenRejected;
            }

            case ConnectionEffect::Promote: {
                ConnectedDevice device;
                device.id = session.id;
                device.name = auth ? auth->deviceName : std::string();
                device.address = session.address;
                device.connectedAt = SystemClock::now();
                if (m_registry.promote(session.id, device)) {
                    spdlog::info("PairingServer: '{}' paired as {}", device.name, session.id);
                    notices.push_back({true, device});
                }
                break;
            }

            case ConnectionEffect::SendAuthSuccess:
                sendMessage(session, PairingMessage(MessageType::AuthSuccess));
                break;

            case ConnectionEffect::InvalidateCredential:
                if (auth) {
                    clearCredentialIfBound(auth->token);
                }
                break;

            case ConnectionEffect::SendAuthFailure:
                sendMessage(session, PairingMessage(MessageType::AuthFailure));
                break;

            case ConnectionEffect::CloseAfterGrace:
                waitGrace();
                closeTransport(session);
                break;

            case ConnectionEffect::SendPong:
                sendMessage(session, PairingMessage(MessageType::Pong));
                break;

            case ConnectionEffect::SendDisconnect:
                sendMessage(session, PairingMessage(MessageType::Disconnect));
                break;

            case ConnectionEffect::CloseTransport:
                closeTransport(session);
                break;

            case ConnectionEffect::Deregister: {
                auto device = m_registry.remove(session.id);
                if (device) {
                    spdlog::info("PairingServer: '{}' disconnected", device->name);
                    notices.push_back({false, *device});
                }
                break;
            }
        }
        return std::nullopt;
    }

    void clearCredentialIfBound(const std::string& token) {
        std::lock_guard<std::mutex> lock(m_credentialMutex);
        if (m_currentCredential && m_currentCredential->token == token) {
            m_currentCredential.reset();
        }
    }

    void waitGrace() {
        std::unique_lock<std::mutex> lock(m_stopMutex);
        m_stopCv.wait_for(lock, m_config.authFailureGrace, [this]() { return !m_running; });
    }

    void closeTransport(Session& session) {
        if (!session.closing.exchange(true)) {
            shutdown(session.sock, SHUTDOWN_BOTH);
        }
    }

    bool sendMessage(Session& session, const PairingMessage& msg) {
        return sendFrame(session, MessageSerializer::serialize(msg));
    }

    bool sendFrame(Session& session, const std::vector<uint8_t>& data) {
        if (data.empty() || session.closing || !m_running) {
            return false;
        }

        std::lock_guard<std::mutex> lock(session.sendMutex);
        size_t totalSent = 0;
        while (totalSent < data.size()) {
            int sent = send(session.sock, reinterpret_cast<const char*>(data.data() + totalSent),
                            static_cast<int>(data.size() - totalSent), MSG_NOSIGNAL);
            if (sent <= 0) {
                int code = SOCKET_ERROR_CODE;
                if (sent < 0 && isInterrupted(code)) {
                    continue;
                }
                spdlog::debug("PairingServer: send to {} failed: {}", session.id, code);
                return false;
            }
            totalSent += static_cast<size_t>(sent);
        }
        return true;
    }

    // ═══════════════════════════════════════════════════════════
    // Callback dispatch
    // ═══════════════════════════════════════════════════════════

    void notifyDeviceConnected(const ConnectedDevice& device) {
        DeviceCallback cb;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            cb = m_onDeviceConnected;
        }
        if (cb) cb(device);
    }

    void notifyDeviceDisconnected(const ConnectedDevice& device) {
        DeviceCallback cb;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            cb = m_onDeviceDisconnected;
        }
        if (cb) cb(device);
    }

    void notifyRunningChanged(bool running) {
        RunningCallback cb;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            cb = m_onRunningChanged;
        }
        if (cb) cb(running);
    }

    void notifyError(PairingError code, const std::string& message) {
        ErrorCallback cb;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            cb = m_onError;
        }
        if (cb) cb(code, message);
    }
};

// ═══════════════════════════════════════════════════════════
// PairingServer Public Interface
// ═══════════════════════════════════════════════════════════

PairingServer::PairingServer(PairingServerConfig config, std::shared_ptr<AddressResolver> resolver)
    : m_impl(std::make_unique<Impl>(std::move(config), std::move(resolver))) {}

PairingServer::~PairingServer() {
    if (m_impl && m_impl->onSessionThread()) {
        // Уничтожение из собственного callback'а: join самого себя невозможен
        spdlog::debug("PairingServer: Destroyed from a callback, deferring cleanup");
        m_impl->stop();
        m_impl.release()->orphan();
    }
}

bool PairingServer::start() { return m_impl->start(); }
void PairingServer::stop() { m_impl->stop(); }
bool PairingServer::isRunning() const { return m_impl->isRunning(); }
uint16_t PairingServer::getPort() const { return m_impl->getPort(); }
const PairingServerConfig& PairingServer::config() const { return m_impl->config(); }

std::optional<PairingQRPayload> PairingServer::issuePairingCredential() {
    return m_impl->issuePairingCredential();
}

void PairingServer::invalidateCurrentCredential() { m_impl->invalidateCurrentCredential(); }

std::optional<PairingQRPayload> PairingServer::currentCredential() const {
    return m_impl->currentCredential();
}

size_t PairingServer::broadcast(const UsageSnapshot& snapshot) {
    return m_impl->broadcastJson(snapshot.toJson());
}

size_t PairingServer::broadcastJson(const std::string& snapshotJson) {
    return m_impl->broadcastJson(snapshotJson);
}

bool PairingServer::disconnect(const std::string& deviceId) { return m_impl->disconnect(deviceId); }
void PairingServer::disconnectAll() { m_impl->disconnectAll(); }

std::vector<ConnectedDevice> PairingServer::connectedDevices() const {
    return m_impl->connectedDevices();
}

size_t PairingServer::connectionCount() const { return m_impl->connectionCount(); }

PairingError PairingServer::getLastError() const { return m_impl->getLastError(); }
std::string PairingServer::getLastErrorMessage() const { return m_impl->getLastErrorMessage(); }

void PairingServer::onDeviceConnected(DeviceCallback callback) {
    m_impl->onDeviceConnected(std::move(callback));
}

void PairingServer::onDeviceDisconnected(DeviceCallback callback) {
    m_impl->onDeviceDisconnected(std::move(callback));
}

void PairingServer::onRunningChanged(RunningCallback callback) {
    m_impl->onRunningChanged(std::move(callback));
}

void PairingServer::onError(ErrorCallback callback) {
    m_impl->onError(std::move(callback));
}

} // namespace MeterLink
