#pragma once

#include <ctime>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include "../sdk/types.h"

namespace ml {

using Tokens = std::vector<std::string>;

/**
 * @brief Тюнер (карта захвата) на одном из бэкендов.
 *
 * Не принадлежит соединению: передаётся в каждую команду.
 */
struct Tuner {
    int tuner_id = 0;
    std::string hostname;
    std::string signature;
};

struct Channel {
    int channel_id = 0;
    std::string channel_number;
    std::string callsign;
    std::string name;
    int tuner_id = 0;
};

struct Schedule {
    std::optional<int> schedule_id;
    std::string title;
    int channel_id = 0;
    int schedule_type = 0;
};

struct Job {
    int id = 0;
    int channel_id = 0;
    std::time_t start_time = 0;
    int type = 0;
    int status = 0;
    std::string comment;
};

/**
 * @brief Рекламная пауза в секундах от начала записи.
 */
class CommercialBreak {
public:
    CommercialBreak(double start, double end) : start_(start), end_(end) {}

    double start() const { return start_; }
    double end() const { return end_; }

    bool is_during(double position) const { return start_ <= position && position <= end_; }

    bool operator==(const CommercialBreak&) const = default;

private:
    double start_;
    double end_;
};

/**
 * @brief Запись программы в том виде, в каком её передаёт бэкенд.
 *
 * Хранит исходные поля ответа (их число задаётся версией протокола) и
 * даёт типизированный доступ к тем, что нужны клиенту. Набор полей можно
 * отправить обратно бэкенду через data().
 */
class Program {
public:
    // Индексы полей в записи
    enum Field : size_t {
        TITLE = 0,
        SUBTITLE = 1,
        DESCRIPTION = 2,
        CATEGORY = 3,
        CHANNEL_ID = 4,
        CHANNEL_NUMBER = 5,
        CALLSIGN = 6,
        CHANNEL_NAME = 7,
        FILENAME = 8,
        FILESIZE_HIGH = 9,
        FILESIZE_LOW = 10,
        START_TIME = 11,
        END_TIME = 12,
        HOSTNAME = 16,
        REC_STATUS = 21,
        RECORDING_GROUP = 30
    };

    static constexpr double DEFAULT_FRAME_RATE = 29.97;

    explicit Program(Tokens fields, double frame_rate = DEFAULT_FRAME_RATE);

    const Tokens& data() const { return fields_; }
    size_t size() const { return fields_.size(); }

    std::string title() const { return field(TITLE); }
    std::string subtitle() const { return field(SUBTITLE); }
    std::string category() const { return field(CATEGORY); }
    std::string channel_id() const { return field(CHANNEL_ID); }
    std::string channel_number() const { return field(CHANNEL_NUMBER); }
    std::string callsign() const { return field(CALLSIGN); }
    std::string filename() const { return field(FILENAME); }
    std::string hostname() const { return field(HOSTNAME); }
    std::string recording_group() const { return field(RECORDING_GROUP); }

    // Имя файла без схемы myth://host:port/
    std::string bare_filename() const;

    // Время начала в виде, который ожидают команды QUERY_BOOKMARK и т.п.
    std::string start_ts() const { return field(START_TIME); }
    std::time_t start_time() const;
    std::time_t end_time() const;

    uint64_t file_size() const;
    int recording_status() const;

    double frame_rate() const { return frame_rate_; }
    void set_frame_rate(double fps) { frame_rate_ = fps; }

private:
    std::string field(size_t index) const;
    long long int_field(size_t index, long long fallback) const;

    Tokens fields_;
    double frame_rate_;
};

/// Фильтр статусов для get_upcoming_recordings()
using StatusFilter = std::vector<int>;

namespace upcoming {
    StatusFilter scheduled();
    StatusFilter conflicts();
    StatusFilter all();
}

double frames_to_seconds(uint64_t frames, double fps);

// Первый токен ответа равен "OK" без учёта регистра
bool is_ok(const Tokens& reply);

// Идентификатор сеанса Live TV: live-<host>-<YYYY-MM-DDTHH:MM:SS>
std::string create_chain_id(const std::string& hostname, std::time_t now);

} // namespace ml
