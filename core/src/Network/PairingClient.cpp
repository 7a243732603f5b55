// PairingClient.cpp — клиент pairing протокола

#include "meterlink/Network/PairingClient.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstring>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    using socket_t = SOCKET;
    #define SOCKET_INVALID INVALID_SOCKET
    #define CLOSE_SOCKET closesocket
    #define SOCKET_ERROR_CODE WSAGetLastError()
    #define MSG_NOSIGNAL 0
#else
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <netdb.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <errno.h>
    using socket_t = int;
    #define SOCKET_INVALID (-1)
    #define CLOSE_SOCKET ::close
    #define SOCKET_ERROR_CODE errno
#endif

namespace MeterLink {

using Clock = std::chrono::steady_clock;

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

bool isRetryable(int code) {
#ifdef _WIN32
    return code == WSAETIMEDOUT || code == WSAEWOULDBLOCK || code == WSAEINTR;
#else
    return code == EAGAIN || code == EWOULDBLOCK || code == EINTR;
#endif
}

} // namespace

// ═══════════════════════════════════════════════════════════
// PairingClient::Impl
// ═══════════════════════════════════════════════════════════

class PairingClient::Impl {
public:
    Impl() {
#ifdef _WIN32
        WSADATA wsaData;
        if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
            spdlog::error("PairingClient: WSAStartup failed");
        }
#endif
    }

    ~Impl() {
        close();
#ifdef _WIN32
        WSACleanup();
#endif
    }

    bool connect(const std::string& host, uint16_t port, int timeoutMs) {
        close();

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

        addrinfo* result = nullptr;
        std::string service = std::to_string(port);
        if (getaddrinfo(host.c_str(), service.c_str(), &hints, &result) != 0 || !result) {
            m_lastError = "Invalid host address: " + host;
            spdlog::error("PairingClient: {}", m_lastError);
            return false;
        }

        socket_t sock = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
        if (sock == SOCKET_INVALID) {
            m_lastError = "Failed to create socket";
            freeaddrinfo(result);
            return false;
        }

        // На Linux SO_SNDTIMEO ограничивает и connect()
        setSocketTimeout(sock, SO_SNDTIMEO, std::chrono::milliseconds(timeoutMs));

        spdlog::info("PairingClient: Connecting to {}:{}", host, port);

        int rc = ::connect(sock, result->ai_addr, static_cast<socklen_t>(result->ai_addrlen));
        freeaddrinfo(result);
        if (rc < 0) {
            m_lastError = "Failed to connect: " + std::to_string(SOCKET_ERROR_CODE);
            spdlog::error("PairingClient: {}", m_lastError);
            CLOSE_SOCKET(sock);
            return false;
        }

        m_socket = sock;
        m_peerClosed = false;
        m_buffer.clear();
        return true;
    }

    AuthResult authenticate(const std::string& token, const std::string& deviceName, int timeoutMs) {
        AuthPayload auth;
        auth.token = token;
        auth.deviceName = deviceName;

        if (!sendMessage(PairingMessage(MessageType::Auth, auth.toJson()))) {
            return AuthResult::NetworkError;
        }

        auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) {
                m_lastError = "Timeout waiting for auth response";
                return AuthResult::Timeout;
            }

            auto msg = receive(static_cast<int>(remaining.count()));
            if (!msg) {
                if (m_peerClosed) {
                    m_lastError = "Connection closed during authentication";
                    return AuthResult::NetworkError;
                }
                m_lastError = "Timeout waiting for auth response";
                return AuthResult::Timeout;
            }

            if (msg->type == MessageType::AuthSuccess) {
                spdlog::info("PairingClient: Authenticated as '{}'", deviceName);
                return AuthResult::Success;
            }
            if (msg->type == MessageType::AuthFailure) {
                m_lastError = "Authentication failed";
                spdlog::warn("PairingClient: {}", m_lastError);
                return AuthResult::Rejected;
            }
            // Прочие сообщения до ответа на auth не интересны
        }
    }

    JoinResult joinByQR(const std::string& qrJson, const std::string& deviceName, int timeoutMs) {
        auto qr = PairingQRPayload::fromJson(qrJson);
        if (!qr) {
            m_lastError = "Invalid QR code";
            return JoinResult::InvalidQRCode;
        }
        if (qr->isExpired()) {
            m_lastError = "Pairing code expired";
            spdlog::warn("PairingClient: {}", m_lastError);
            return JoinResult::Expired;
        }

        if (!connect(qr->host, qr->port, timeoutMs)) {
            return JoinResult::ConnectionFailed;
        }

        switch (authenticate(qr->token, deviceName, timeoutMs)) {
            case AuthResult::Success: return JoinResult::Success;
            case AuthResult::Rejected: return JoinResult::Rejected;
            case AuthResult::Timeout: return JoinResult::Timeout;
            case AuthResult::NetworkError: return JoinResult::ConnectionFailed;
        }
        return JoinResult::ConnectionFailed;
    }

    std::optional<PairingMessage> receive(int timeoutMs) {
        auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
        std::vector<uint8_t> chunk(16 * 1024);

        while (true) {
            // Сначала разбираем уже накопленное
            while (!m_buffer.empty()) {
                if (MessageSerializer::isHeaderCorrupt(m_buffer.data(), m_buffer.size())) {
                    m_lastError = "Framing violation from server";
                    spdlog::warn("PairingClient: {}", m_lastError);
                    close();
                    return std::nullopt;
                }
                size_t frameSize = MessageSerializer::getFrameSize(m_buffer.data(), m_buffer.size());
                if (frameSize == 0 || frameSize > m_buffer.size()) {
                    break;
                }
                auto msg = MessageSerializer::deserialize(m_buffer.data(), frameSize);
                m_buffer.erase(m_buffer.begin(), m_buffer.begin() + frameSize);
                if (msg) {
                    return msg;
                }
                spdlog::debug("PairingClient: Dropped malformed envelope");
            }

            if (m_socket == SOCKET_INVALID || m_peerClosed) {
                return std::nullopt;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) {
                return std::nullopt;
            }
            setSocketTimeout(m_socket, SO_RCVTIMEO, remaining);

            int received = recv(m_socket, reinterpret_cast<char*>(chunk.data()),
                                static_cast<int>(chunk.size()), 0);
            if (received == 0) {
                m_peerClosed = true;
                return std::nullopt;
            }
            if (received < 0) {
                int code = SOCKET_ERROR_CODE;
                if (isRetryable(code)) {
                    continue;
                }
                m_lastError = "recv failed: " + std::to_string(code);
                m_peerClosed = true;
                return std::nullopt;
            }

            m_buffer.insert(m_buffer.end(), chunk.begin(), chunk.begin() + received);
        }
    }

    bool waitForClose(int timeoutMs) {
        auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
        while (!m_peerClosed && m_socket != SOCKET_INVALID) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) {
                return false;
            }
            receive(static_cast<int>(remaining.count()));
        }
        return true;
    }

    bool sendMessage(const PairingMessage& msg) {
        auto data = MessageSerializer::serialize(msg);
        if (data.empty()) {
            m_lastError = "Failed to serialize message";
            return false;
        }
        return sendRaw(data);
    }

    bool sendRaw(const std::vector<uint8_t>& data) {
        if (m_socket == SOCKET_INVALID) {
            m_lastError = "Not connected";
            return false;
        }

        size_t totalSent = 0;
        while (totalSent < data.size()) {
            int sent = send(m_socket, reinterpret_cast<const char*>(data.data() + totalSent),
                            static_cast<int>(data.size() - totalSent), MSG_NOSIGNAL);
            if (sent <= 0) {
                m_lastError = "Failed to send: " + std::to_string(SOCKET_ERROR_CODE);
                spdlog::debug("PairingClient: {}", m_lastError);
                return false;
            }
            totalSent += static_cast<size_t>(sent);
        }
        return true;
    }

    void disconnect() {
        if (m_socket == SOCKET_INVALID) return;
        if (!m_peerClosed) {
            sendMessage(PairingMessage(MessageType::Disconnect));
        }
        close();
    }

    void close() {
        if (m_socket != SOCKET_INVALID) {
            CLOSE_SOCKET(m_socket);
            m_socket = SOCKET_INVALID;
        }
        m_buffer.clear();
    }

    bool isConnected() const { return m_socket != SOCKET_INVALID && !m_peerClosed; }
    std::string getLastError() const { return m_lastError; }

private:
    socket_t m_socket = SOCKET_INVALID;
    bool m_peerClosed = false;
    std::vector<uint8_t> m_buffer;
    std::string m_lastError;
};

// ═══════════════════════════════════════════════════════════
// PairingClient Public Interface
// ═══════════════════════════════════════════════════════════

PairingClient::PairingClient() : m_impl(std::make_unique<Impl>()) {}
PairingClient::~PairingClient() = default;

bool PairingClient::connect(const std::string& host, uint16_t port, int timeoutMs) {
    return m_impl->connect(host, port, timeoutMs);
}

PairingClient::AuthResult PairingClient::authenticate(const std::string& token,
                                                      const std::string& deviceName,
                                                      int timeoutMs) {
    return m_impl->authenticate(token, deviceName, timeoutMs);
}

PairingClient::JoinResult PairingClient::joinByQR(const std::string& qrJson,
                                                  const std::string& deviceName,
                                                  int timeoutMs) {
    return m_impl->joinByQR(qrJson, deviceName, timeoutMs);
}

std::optional<PairingMessage> PairingClient::receive(int timeoutMs) { return m_impl->receive(timeoutMs); }
bool PairingClient::waitForClose(int timeoutMs) { return m_impl->waitForClose(timeoutMs); }
bool PairingClient::sendMessage(const PairingMessage& msg) { return m_impl->sendMessage(msg); }
bool PairingClient::sendPing() { return m_impl->sendMessage(PairingMessage(MessageType::Ping)); }
bool PairingClient::sendRaw(const std::vector<uint8_t>& data) { return m_impl->sendRaw(data); }
void PairingClient::disconnect() { m_impl->disconnect(); }
void PairingClient::close() { m_impl->close(); }
bool PairingClient::isConnected() const { return m_impl->isConnected(); }
std::string PairingClient::getLastError() const { return m_impl->getLastError(); }

const char* PairingClient::authResultToString(AuthResult result) {
    switch (result) {
        case AuthResult::Success: return "success";
        case AuthResult::Rejected: return "rejected";
        case AuthResult::Timeout: return "timeout";
        case AuthResult::NetworkError: return "networkError";
        default: return "unknown";
    }
}

const char* PairingClient::joinResultToString(JoinResult result) {
    switch (result) {
        case JoinResult::Success: return "success";
        case JoinResult::InvalidQRCode: return "invalidQRCode";
        case JoinResult::Expired: return "expired";
        case JoinResult::ConnectionFailed: return "connectionFailed";
        case JoinResult::Rejected: return "rejected";
        case JoinResult::Timeout: return "timeout";
        default: return "unknown";
    }
}

} // namespace MeterLink
