// PairingTokenStore.cpp — одноразовые токены, отложенное удаление в одном потоке

#include "meterlink/PairingTokenStore.h"
#include "meterlink/Crypto.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace MeterLink {

using Clock = std::chrono::steady_clock;

namespace {

// Tokens are capabilities: never log them in full
std::string tokenPrefix(const std::string& value) {
    return value.substr(0, 8);
}

} // namespace

// ═══════════════════════════════════════════════════════════
// PairingTokenStore::Impl
// ═══════════════════════════════════════════════════════════

class PairingTokenStore::Impl {
public:
    Impl(std::chrono::milliseconds tokenLifetime, std::chrono::milliseconds purgeGrace)
        : m_tokenLifetime(tokenLifetime)
        , m_purgeGrace(purgeGrace) {
        m_janitorThread = std::thread([this]() { janitorLoop(); });
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_cv.notify_all();
        if (m_janitorThread.joinable()) {
            m_janitorThread.join();
        }
    }

    PairingToken issue() {
        PairingToken token;
        token.value = Crypto::generateUUID();

        auto now = Clock::now();
        token.deadline = now + m_tokenLifetime;
        token.expiresAt = SystemClock::now() +
            std::chrono::duration_cast<SystemClock::duration>(m_tokenLifetime);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            purgeInvalidLocked(now);
            m_tokens[token.value] = Entry{token, token.deadline + m_purgeGrace};
        }
        m_cv.notify_all();

        spdlog::debug("PairingTokenStore: Issued token {}..., expires in {}ms",
                      tokenPrefix(token.value), m_tokenLifetime.count());
        return token;
    }

    bool validateAndConsume(const std::string& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tokens.find(value);
        if (it == m_tokens.end() || !it->second.token.isValid(Clock::now())) {
            return false;
        }
        it->second.token.consumed = true;
        spdlog::debug("PairingTokenStore: Consumed token {}...", tokenPrefix(value));
        return true;
    }

    bool isValid(const std::string& value) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tokens.find(value);
        return it != m_tokens.end() && it->second.token.isValid(Clock::now());
    }

    std::optional<std::chrono::milliseconds> timeRemaining(const std::string& value) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tokens.find(value);
        if (it == m_tokens.end()) {
            return std::nullopt;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            it->second.token.deadline - Clock::now());
        return std::max(remaining, std::chrono::milliseconds(0));
    }

    void invalidate(const std::string& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_tokens.erase(value) > 0) {
            spdlog::debug("PairingTokenStore: Invalidated token {}...", tokenPrefix(value));
        }
    }

    void invalidateAll() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tokens.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tokens.size();
    }

    std::chrono::milliseconds tokenLifetime() const { return m_tokenLifetime; }

private:
    struct Entry {
        PairingToken token;
        Clock::time_point purgeAt;
    };

    const std::chrono::milliseconds m_tokenLifetime;
    const std::chrono::milliseconds m_purgeGrace;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, Entry> m_tokens;
    bool m_stopping = false;
    std::thread m_janitorThread;

    void purgeInvalidLocked(Clock::time_point now) {
        for (auto it = m_tokens.begin(); it != m_tokens.end();) {
            if (!it->second.token.isValid(now)) {
                it = m_tokens.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Sleeps until the earliest purge deadline. An invalidated entry is simply
    // gone from the map, so its deadline is never acted upon.
    void janitorLoop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_stopping) {
            if (m_tokens.empty()) {
                m_cv.wait(lock);
                continue;
            }

            auto earliest = Clock::time_point::max();
            for (const auto& [value, entry] : m_tokens) {
                earliest = std::min(earliest, entry.purgeAt);
            }

            if (m_cv.wait_until(lock, earliest) != std::cv_status::timeout) {
                continue;  // Woken by issue/stop: recompute
            }

            auto now = Clock::now();
            for (auto it = m_tokens.begin(); it != m_tokens.end();) {
                if (it->second.purgeAt <= now) {
                    spdlog::debug("PairingTokenStore: Purged token {}...", tokenPrefix(it->first));
                    it = m_tokens.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }
};

// ═══════════════════════════════════════════════════════════
// PairingTokenStore Public Interface
// ═══════════════════════════════════════════════════════════

PairingTokenStore::PairingTokenStore(std::chrono::milliseconds tokenLifetime,
                                     std::chrono::milliseconds purgeGrace)
    : m_impl(std::make_unique<Impl>(tokenLifetime, purgeGrace)) {}

PairingTokenStore::~PairingTokenStore() = default;

PairingToken PairingTokenStore::issue() { return m_impl->issue(); }
bool PairingTokenStore::validateAndConsume(const std::string& value) { return m_impl->validateAndConsume(value); }
bool PairingTokenStore::isValid(const std::string& value) const { return m_impl->isValid(value); }

std::optional<std::chrono::milliseconds> PairingTokenStore::timeRemaining(const std::string& value) const {
    return m_impl->timeRemaining(value);
}

void PairingTokenStore::invalidate(const std::string& value) { m_impl->invalidate(value); }
void PairingTokenStore::invalidateAll() { m_impl->invalidateAll(); }
size_t PairingTokenStore::size() const { return m_impl->size(); }
std::chrono::milliseconds PairingTokenStore::tokenLifetime() const { return m_impl->tokenLifetime(); }

} // namespace MeterLink
