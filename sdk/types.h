#pragma once
#include <cstdint>
#include <cstddef>

#ifdef __cplusplus
extern "C" {
#endif

// Параметры кадра сообщения
#define MLINK_LENGTH_FIELD_SIZE 8
#define MLINK_SEPARATOR "[]:[]"

// Протокол
#define MLINK_INIT_PROTOCOL_VERSION 8
#define MLINK_DEFAULT_PORT 6543

// Передача файлов
#define MLINK_MAX_BLOCK_SIZE 2000000

// Маркеры рекламных пауз в ответе QUERY_COMMBREAK
#define MLINK_COMM_START 4
#define MLINK_COMM_END   5

// Режим объявления командного сокета
typedef enum {
    ANNOUNCE_NONE = 0,
    ANNOUNCE_PLAYBACK = 1,
    ANNOUNCE_MONITOR = 2
} announce_t;

// Состояния тюнера (QUERY_REMOTEENCODER ... GET_STATE)
typedef enum {
    TV_STATE_ERROR = -1,
    TV_STATE_OK = 0,
    TV_STATE_WATCHING_LIVETV = 1,
    TV_STATE_WATCHING_PRERECORDED = 2,
    TV_STATE_WATCHING_VIDEO = 3,
    TV_STATE_WATCHING_DVD = 4,
    TV_STATE_WATCHING_RECORDING = 5,
    TV_STATE_RECORDING_ONLY = 6
} tv_state_t;

// Статус записи (поле recstatus записи программы)
typedef enum {
    REC_STATUS_DELETED = -5,
    REC_STATUS_STOPPED = -4,
    REC_STATUS_RECORDED = -3,
    REC_STATUS_RECORDING = -2,
    REC_STATUS_WILL_RECORD = -1,
    REC_STATUS_UNKNOWN = 0,
    REC_STATUS_DONT_RECORD = 1,
    REC_STATUS_PREVIOUS_RECORDING = 2,
    REC_STATUS_CURRENT_RECORDING = 3,
    REC_STATUS_EARLIER_SHOWING = 4,
    REC_STATUS_TOO_MANY_RECORDINGS = 5,
    REC_STATUS_NOT_LISTED = 6,
    REC_STATUS_CONFLICT = 7,
    REC_STATUS_LATER_SHOWING = 8,
    REC_STATUS_REPEAT = 9,
    REC_STATUS_INACTIVE = 10,
    REC_STATUS_NEVER_RECORD = 11,
    REC_STATUS_OFFLINE = 12,
    REC_STATUS_OTHER_SHOWING = 13
} rec_status_t;

#ifdef __cplusplus
}
#endif
