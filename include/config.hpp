#pragma once

#include <mutex>
#include <string>
#include <variant>
#include <optional>
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

namespace ml {

class EventBus;

/**
 * @brief Настройки клиента (SettingsStore).
 *
 * Ключи вида "mythtv.host". Значения читаются из JSON, где вложенные
 * объекты разворачиваются в ключи через точку. Изменение уже существующего
 * значения публикует SettingChanged в подключённую шину.
 */
class Config {
public:
    struct Defaults {
        static const std::string HOST;
        static const int PORT;
        static const int INIT_VERSION;
        static const int MAX_BLOCK_SIZE;
        static const std::string LOG_LEVEL;
    };

    using Value = std::variant<int, bool, double, std::string>;

    Config();
    ~Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    bool load_from_file(const fs::path& config_file);
    bool load_from_string(const std::string& config_str) {
        return parse_json(config_str);
    }

    bool save_to_file(const fs::path& config_file) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        store(key, Value(value));
    }

    void set(const std::string& key, const char* value) {
        store(key, Value(std::string(value)));
    }

    template<typename T>
    std::optional<T> get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it != values_.end()) {
            if (const T* val = std::get_if<T>(&it->second)) {
                return *val;
            }
            report_type_mismatch(key);
        }
        return std::nullopt;
    }

    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        auto val = get<T>(key);
        return val.has_value() ? val.value() : default_value;
    }

    // Значение в строковом виде, пустая строка если ключа нет
    std::string get_string(const std::string& key) const;


    // Публикация SettingChanged. nullptr отключает
    void attach_bus(EventBus* bus);

    // Проверка mythtv.host (непустой и резолвится) и mythtv.port, при ошибке SettingsError
    void verify() const;

    static void verify_host(const std::string& host);
    static void verify_port(int port);

    // Адрес и порт мастер-бэкенда
    std::string backend_host() const;
    uint16_t backend_port() const;

    // client.hostname или имя этой машины
    std::string client_hostname() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Value> values_;
    EventBus* bus_ = nullptr;

    void setup_defaults();
    void store(const std::string& key, Value value);
    void report_type_mismatch(const std::string& key) const;
    bool parse_json(const std::string& json_str);
    std::string to_json() const;

    static std::string to_string(const Value& value);
};

} // namespace ml
