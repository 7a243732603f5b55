// ffi_server.cpp — C API for PairingServer

#include "ffi_internal.h"
#include "meterlink/meterlink_c.h"
#include "meterlink/Network/PairingServer.h"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace MeterLink;
using json = nlohmann::json;

namespace {

enum class ServerEvent : int32_t {
    DeviceConnected = 0,
    DeviceDisconnected = 1,
    RunningChanged = 2,
    Error = 3
};

struct ServerWrapper {
    std::unique_ptr<PairingServer> server;
    std::mutex callbackMutex;
    MLServerCallback callback = nullptr;
    void* userData = nullptr;

    explicit ServerWrapper(PairingServerConfig config)
        : server(std::make_unique<PairingServer>(std::move(config))) {
        // Строки событий выделяются в куче: хост читает их асинхронно
        // и обязан освободить через ml_free_string()
        server->onDeviceConnected([this](const ConnectedDevice& device) {
            emit(ServerEvent::DeviceConnected, device.toJson());
        });
        server->onDeviceDisconnected([this](const ConnectedDevice& device) {
            emit(ServerEvent::DeviceDisconnected, device.toJson());
        });
        server->onRunningChanged([this](bool running) {
            emit(ServerEvent::RunningChanged, json{{"running", running}}.dump());
        });
        server->onError([this](PairingError code, const std::string& message) {
            emit(ServerEvent::Error,
                 json{{"code", pairingErrorToString(code)}, {"message", message}}.dump());
        });
    }

    ~ServerWrapper() {
        // Остановить потоки до того, как callback'и станут недействительны
        server.reset();
    }

    void emit(ServerEvent event, const std::string& data) {
        MLServerCallback cb;
        void* user;
        {
            std::lock_guard<std::mutex> lock(callbackMutex);
            cb = callback;
            user = userData;
        }
        if (cb) {
            cb(static_cast<int32_t>(event), alloc_string(data), user);
        }
    }
};

ServerWrapper* toWrapper(MLPairingServer handle) {
    return reinterpret_cast<ServerWrapper*>(handle);
}

MLPairingServer createServer(PairingServerConfig config) {
    try {
        auto* wrapper = new ServerWrapper(std::move(config));
        clearLastError();
        return reinterpret_cast<MLPairingServer>(wrapper);
    } catch (const std::exception& e) {
        setLastError(ML_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

MLError toMLError(PairingError error) {
    switch (error) {
        case PairingError::None: return ML_OK;
        case PairingError::ServerNotRunning: return ML_ERROR_NOT_RUNNING;
        case PairingError::InvalidConfig: return ML_ERROR_INVALID_ARGUMENT;
        case PairingError::BindFailed:
        case PairingError::ListenFailed:
        case PairingError::SocketFailed: return ML_ERROR_NETWORK;
        default: return ML_ERROR_INTERNAL;
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════

MLPairingServer ml_server_create(void) {
    return createServer(PairingServerConfig{});
}

MLPairingServer ml_server_create_with_config(const char* config_json) {
    if (!config_json) {
        setLastError(ML_ERROR_INVALID_ARGUMENT, "config_json is null");
        return nullptr;
    }

    auto config = PairingServerConfig::fromJson(config_json);
    if (!config) {
        setLastError(ML_ERROR_INVALID_ARGUMENT, "Invalid server configuration");
        return nullptr;
    }
    return createServer(std::move(*config));
}

void ml_server_destroy(MLPairingServer server) {
    delete toWrapper(server);
}

void ml_server_set_callback(MLPairingServer server, MLServerCallback callback, void* user_data) {
    auto* wrapper = toWrapper(server);
    if (!wrapper) return;

    std::lock_guard<std::mutex> lock(wrapper->callbackMutex);
    wrapper->callback = callback;
    wrapper->userData = user_data;
}

MLError ml_server_start(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    if (!wrapper) {
        setLastError(ML_ERROR_INVALID_ARGUMENT, "server is null");
        return ML_ERROR_INVALID_ARGUMENT;
    }

    if (!wrapper->server->start()) {
        MLError error = toMLError(wrapper->server->getLastError());
        setLastError(error, wrapper->server->getLastErrorMessage());
        return error;
    }

    clearLastError();
    return ML_OK;
}

void ml_server_stop(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    if (!wrapper) return;
    wrapper->server->stop();
}

int32_t ml_server_is_running(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    return (wrapper && wrapper->server->isRunning()) ? 1 : 0;
}

int32_t ml_server_get_port(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    return wrapper ? static_cast<int32_t>(wrapper->server->getPort()) : 0;
}

// ═══════════════════════════════════════════════════════════
// Credentials
// ═══════════════════════════════════════════════════════════

char* ml_server_issue_credential(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    if (!wrapper) {
        setLastError(ML_ERROR_INVALID_ARGUMENT, "server is null");
        return nullptr;
    }

    try {
        auto payload = wrapper->server->issuePairingCredential();
        if (!payload) {
            setLastError(ML_ERROR_NOT_RUNNING, wrapper->server->getLastErrorMessage());
            return nullptr;
        }
        clearLastError();
        return alloc_string(payload->toJson());
    } catch (const std::runtime_error& e) {
        setLastError(ML_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

char* ml_server_current_credential(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    if (!wrapper) return nullptr;

    auto payload = wrapper->server->currentCredential();
    return payload ? alloc_string(payload->toJson()) : nullptr;
}

void ml_server_invalidate_credential(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    if (!wrapper) return;
    wrapper->server->invalidateCurrentCredential();
}

// ═══════════════════════════════════════════════════════════
// Broadcast & devices
// ═══════════════════════════════════════════════════════════

int32_t ml_server_broadcast(MLPairingServer server, const char* snapshot_json) {
    auto* wrapper = toWrapper(server);
    if (!wrapper || !snapshot_json) {
        setLastError(ML_ERROR_INVALID_ARGUMENT, "server or snapshot_json is null");
        return -1;
    }
    if (!json::accept(snapshot_json)) {
        setLastError(ML_ERROR_INVALID_ARGUMENT, "snapshot_json is not valid JSON");
        return -1;
    }
    if (!wrapper->server->isRunning()) {
        setLastError(ML_ERROR_NOT_RUNNING, "Pairing server is not running");
        return -1;
    }

    clearLastError();
    return static_cast<int32_t>(wrapper->server->broadcastJson(snapshot_json));
}

MLError ml_server_disconnect(MLPairingServer server, const char* device_id) {
    auto* wrapper = toWrapper(server);
    if (!wrapper || !device_id) {
        setLastError(ML_ERROR_INVALID_ARGUMENT, "server or device_id is null");
        return ML_ERROR_INVALID_ARGUMENT;
    }
    if (!wrapper->server->disconnect(device_id)) {
        setLastError(ML_ERROR_NOT_FOUND, std::string("Unknown device: ") + device_id);
        return ML_ERROR_NOT_FOUND;
    }
    clearLastError();
    return ML_OK;
}

void ml_server_disconnect_all(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    if (!wrapper) return;
    wrapper->server->disconnectAll();
}

char* ml_server_get_devices(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    if (!wrapper) {
        setLastError(ML_ERROR_INVALID_ARGUMENT, "server is null");
        return nullptr;
    }

    json arr = json::array();
    for (const auto& device : wrapper->server->connectedDevices()) {
        arr.push_back(json::parse(device.toJson()));
    }
    return alloc_string(arr.dump());
}

int32_t ml_server_connection_count(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    return wrapper ? static_cast<int32_t>(wrapper->server->connectionCount()) : 0;
}

char* ml_server_last_error(MLPairingServer server) {
    auto* wrapper = toWrapper(server);
    if (!wrapper) {
        setLastError(ML_ERROR_INVALID_ARGUMENT, "server is null");
        return nullptr;
    }

    json j = {
        {"code", pairingErrorToString(wrapper->server->getLastError())},
        {"message", wrapper->server->getLastErrorMessage()}
    };
    return alloc_string(j.dump());
}
