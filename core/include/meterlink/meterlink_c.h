// meterlink_c.h — C API для FFI (Swift / Flutter)
// Все строки, возвращаемые как char*, освобождаются через ml_free_string

#ifndef METERLINK_C_H
#define METERLINK_C_H

#include "export.h"
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ═══════════════════════════════════════════════════════════
// Opaque handles
// ═══════════════════════════════════════════════════════════

typedef struct MLPairingServer_* MLPairingServer;

// ═══════════════════════════════════════════════════════════
// Коды ошибок
// ═══════════════════════════════════════════════════════════

typedef enum {
    ML_OK = 0,
    ML_ERROR_INVALID_ARGUMENT = 1,
    ML_ERROR_NOT_RUNNING = 2,     // Сервер не запущен
    ML_ERROR_NETWORK = 3,         // socket/bind/listen
    ML_ERROR_NOT_FOUND = 4,
    ML_ERROR_INTERNAL = 99
} MLError;

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

/// Возвращает версию библиотеки
ML_API const char* ml_version(void);

/// Возвращает текстовое описание ошибки
ML_API const char* ml_error_message(MLError error);

/// Получить последнюю ошибку (thread-local)
ML_API MLError ml_last_error(void);

/// Получить сообщение последней ошибки (thread-local)
ML_API const char* ml_last_error_message(void);

/// Очистить состояние ошибки
ML_API void ml_clear_error(void);

/// Освобождает строку, выделенную библиотекой
ML_API void ml_free_string(char* str);

/// Уровень логирования: 0=trace 1=debug 2=info 3=warn 4=error 5=critical 6=off
ML_API MLError ml_set_log_level(int32_t level);

// ═══════════════════════════════════════════════════════════
// Pairing Server
// ═══════════════════════════════════════════════════════════

/// Событие сервера
/// @param event 0=device_connected, 1=device_disconnected, 2=running_changed, 3=error
/// @param data_json JSON с данными события (освободить через ml_free_string)
typedef void (*MLServerCallback)(int32_t event, const char* data_json, void* user_data);

/// Создать сервер с настройками по умолчанию
ML_API MLPairingServer ml_server_create(void);

/// Создать сервер с настройками из JSON (см. PairingServerConfig)
/// @return NULL при невалидной конфигурации
ML_API MLPairingServer ml_server_create_with_config(const char* config_json);

/// Остановить и уничтожить сервер
ML_API void ml_server_destroy(MLPairingServer server);

/// Установить callback событий (NULL = отключить)
ML_API void ml_server_set_callback(MLPairingServer server, MLServerCallback callback, void* user_data);

/// Запустить сервер (идемпотентно)
ML_API MLError ml_server_start(MLPairingServer server);

/// Остановить сервер (идемпотентно)
ML_API void ml_server_stop(MLPairingServer server);

ML_API int32_t ml_server_is_running(MLPairingServer server);

/// Фактический порт (0 если не запущен)
ML_API int32_t ml_server_get_port(MLPairingServer server);

/// Выдать новый QR payload (JSON)
/// @return NULL если сервер не запущен
ML_API char* ml_server_issue_credential(MLPairingServer server);

/// Текущий QR payload (JSON) или NULL
ML_API char* ml_server_current_credential(MLPairingServer server);

/// Отозвать текущий QR
ML_API void ml_server_invalidate_credential(MLPairingServer server);

/// Разослать snapshot (JSON) аутентифицированным устройствам
/// @return число получателей или -1 при ошибке
ML_API int32_t ml_server_broadcast(MLPairingServer server, const char* snapshot_json);

/// Отключить устройство
ML_API MLError ml_server_disconnect(MLPairingServer server, const char* device_id);

/// Отключить все устройства
ML_API void ml_server_disconnect_all(MLPairingServer server);

/// Подключённые устройства (JSON array)
ML_API char* ml_server_get_devices(MLPairingServer server);

/// Количество открытых соединений
ML_API int32_t ml_server_connection_count(MLPairingServer server);

/// Последняя ошибка сервера: {"code": "...", "message": "..."}
ML_API char* ml_server_last_error(MLPairingServer server);

#ifdef __cplusplus
}
#endif

#endif // METERLINK_C_H
