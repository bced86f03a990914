#pragma once

#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

#include "domain.hpp"
#include "signals.hpp"
#include "../core/protocolNegotiator.hpp"

namespace ml {

class Config;
class EventBus;
class IDatabase;
class IStreamConnector;
class MessageChannel;
struct FileTransferHandle;

/**
 * @brief Общие зависимости всех соединений процесса.
 *
 * Создаётся один раз при старте. config, connector, registry и versions
 * обязательны, bus и database могут отсутствовать.
 */
struct ConnectionContext {
    std::shared_ptr<Config> config;
    std::shared_ptr<EventBus> bus;
    std::shared_ptr<IStreamConnector> connector;
    std::shared_ptr<IDatabase> database;
    std::shared_ptr<const ProtocolRegistry> registry;
    std::shared_ptr<VersionCache> versions;
};

// Как командный сокет представляется бэкенду
enum class Announce {
    None,
    // Не даёт бэкенду выключиться
    Playback,
    // Позволяет бэкенду выключиться
    Monitor
};

struct FreeTuner {
    int tuner_id = -1;
    std::string host;
    int port = -1;
};

struct DiskUsage {
    std::string hostname;
    std::string directory;
    uint64_t total = 0;
    uint64_t used = 0;
    uint64_t free = 0;
};

// Средняя нагрузка бэкенда за 1, 5 и 15 минут
struct LoadAverage {
    std::string one;
    std::string five;
    std::string fifteen;
};

/**
 * @brief Соединение с бэкендом MythTV.
 *
 * Владеет одним командным сокетом, открытым с ANN Playback при создании.
 * Версия протокола фиксируется при первом рукопожатии и не меняется.
 * Один поток за раз: на сокете не больше одного запроса.
 */
class Connection {
public:
    explicit Connection(ConnectionContext context);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Новый сокет к бэкенду с рукопожатием и объявлением.
     *
     * @param announce режим объявления, None - без ANN
     * @param target_host хост бэкенда, пустая строка - мастер
     */
    std::unique_ptr<MessageChannel> connect(Announce announce, const std::string& target_host = "");

    // DONE и закрытие командного сокета. Повторный вызов ничего не делает
    void close();
    bool is_open() const;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    int protocol_version() const { return protocol_->version(); }
    const Protocol& protocol() const { return *protocol_; }

    MessageChannel& command_channel();

    // Тюнеры
    int get_tuner_status(const Tuner& tuner);
    uint64_t get_frames_written(const Tuner& tuner);
    uint64_t get_tuner_file_position(const Tuner& tuner);
    double get_tuner_frame_rate(const Tuner& tuner);
    Program get_current_recording(const Tuner& tuner);
    int get_tuner_showing(const std::string& title);
    bool is_tuner_recording(const Tuner& tuner);
    int get_num_free_tuners();
    FreeTuner get_free_tuner();
    std::optional<FreeTuner> get_next_free_tuner(int after_tuner_id);

    // Live TV
    std::string spawn_live_tv(const Tuner& tuner, const std::string& channel_number);
    void stop_live_tv(const Tuner& tuner);

    // Записи
    int delete_recording(const Program& program);
    int rerecord_recording(const Program& program);
    std::vector<Program> get_all_recordings();
    // Без учёта регистра; "All Groups" и "All Shows" снимают фильтр
    std::vector<Program> get_recordings(const std::string& group = "Default",
                                        const std::string& title = "All Shows");
    std::optional<Program> get_recording(int channel_id, const std::string& start_ts);
    std::vector<Program> get_scheduled_recordings();
    std::vector<Program> get_upcoming_recordings(const StatusFilter& filter = upcoming::scheduled());

    // Закладки и рекламные паузы
    uint64_t get_bookmark(const Program& program);
    void set_bookmark(const Program& program, uint64_t frame);
    std::vector<CommercialBreak> get_commercial_breaks(const Program& program);

    // Состояние бэкенда
    DiskUsage get_disk_usage();
    LoadAverage get_load();
    std::optional<std::chrono::seconds> get_uptime();
    Tokens get_setting(const std::string& key, const std::string& hostname);
    std::string get_guide_data_status();

    // Миниатюры
    bool generate_thumbnail(const Program& program, const std::string& backend_host);
    std::optional<std::time_t> get_thumbnail_creation_time(const Program& program,
                                                          const std::string& backend_host);

    // Расписания
    void reschedule_notify(std::optional<int> schedule_id = std::nullopt);
    void save_schedule(Schedule& schedule);
    void delete_schedule(const Schedule& schedule);
    std::vector<Channel> get_channels();
    std::vector<Tuner> get_tuners();

    // Файлы
    std::unique_ptr<MessageChannel> announce_file_transfer(const std::string& backend_host,
                                                           const std::string& path,
                                                           FileTransferHandle& handle);
    uint64_t get_file_size(const std::string& path, const std::string& backend_host = "");

    /**
     * @brief Копирует файл бэкенда (myth://host:port/path) в dest.
     *
     * @return false если удалённый файл пустой
     */
    bool transfer_file(const std::string& path,
                       const std::filesystem::path& dest,
                       const std::string& backend_host = "");

private:
    ConnectionContext context_;
    ProtocolNegotiator negotiator_;
    std::string host_;
    uint16_t port_;
    std::string client_host_;
    const Protocol* protocol_ = nullptr;
    std::unique_ptr<MessageChannel> cmd_;

    Tokens request(const Tokens& tokens);

    // Запрос через командный сокет мастера или короткое соединение с другим хостом
    Tokens request_on_host(const std::string& backend_host, const Tokens& tokens);

    void announce(MessageChannel& channel, Announce announce);
    // Версия сервера из кэша или пробным сокетом к мастеру
    int server_version();
    void publish(const Event& event);
    IDatabase& database();
    bool is_master(const std::string& backend_host) const;

    std::vector<Program> parse_records(const Tokens& reply, size_t offset, size_t count) const;
    std::vector<Program> query_recordings();

    // DONE + close, ошибки только логируются
    static void say_goodbye(MessageChannel& channel);
};

/**
 * @brief Пробное соединение с мастер-бэкендом по текущим настройкам.
 *
 * Открывает и сразу закрывает Connection.
 * @throws SettingsError "Connection to MythTV failed: ..." при любой ошибке
 * рукопожатия, объявления или транспорта
 */
void verify_connectivity(const ConnectionContext& context);

} // namespace ml
