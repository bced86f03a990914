#include "config.hpp"
#include "logger.hpp"
#include "errors.hpp"
#include "signals.hpp"
#include "../sdk/types.h"

#include <string>
#include <sstream>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/host_name.hpp>

namespace ml {

const std::string Config::Defaults::HOST = "localhost";
const int Config::Defaults::PORT = MLINK_DEFAULT_PORT;
const int Config::Defaults::INIT_VERSION = MLINK_INIT_PROTOCOL_VERSION;
const int Config::Defaults::MAX_BLOCK_SIZE = MLINK_MAX_BLOCK_SIZE;
const std::string Config::Defaults::LOG_LEVEL = "INFO";

LOGGER("CONFIG");

Config::Config() {
    setup_defaults();
}

Config::~Config() = default;

void Config::setup_defaults() {
    // Бэкенд
    set("mythtv.host", Defaults::HOST);
    set("mythtv.port", Defaults::PORT);
    set("mythtv.init_version", Defaults::INIT_VERSION);

    // Передача файлов
    set("transfer.max_block_size", Defaults::MAX_BLOCK_SIZE);

    // Логирование
    set("logging.level", Defaults::LOG_LEVEL);
    set("logging.file", std::string());

    // Пустое имя -> имя машины
    set("client.hostname", std::string());

    logger.debug("Default configuration loaded");
}

void Config::store(const std::string& key, Value value) {
    std::optional<SettingChanged> changed;
    EventBus* bus = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it != values_.end()) {
            if (it->second != value) {
                changed = SettingChanged{ key, to_string(it->second), to_string(value) };
            }
            it->second = std::move(value);
        } else {
            values_.emplace(key, std::move(value));
        }
        bus = bus_;
    }

    if (key.find("password") != std::string::npos) {
        logger.debug("Config set: {} = *secret*", key);
    } else {
        logger.debug("Config set: {} = {}", key, get_string(key));
    }

    // Уведомляем только об изменении существующего значения
    if (changed && bus) {
        bus->publish(Event(std::move(*changed)));
    }
}

void Config::report_type_mismatch(const std::string& key) const {
    logger.error("Config type mismatch for key: {}", key);
}

std::string Config::to_string(const Value& value) {
    return std::visit([](const auto& val) -> std::string {
        using U = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<U, std::string>) {
            return val;
        } else if constexpr (std::is_same_v<U, bool>) {
            return val ? "True" : "False";
        } else {
            return fmt::format("{}", val);
        }
    }, value);
}

std::string Config::get_string(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    return it == values_.end() ? std::string() : to_string(it->second);
}

bool Config::load_from_file(const fs::path& config_file) {
    if (!fs::exists(config_file)) {
        logger.warning("Config file not found: {}", config_file.string());
        return false;
    }

    try {
        std::ifstream file(config_file);
        if (!file.is_open()) {
            logger.error("Failed to open config file: {}", config_file.string());
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        return parse_json(buffer.str());

    } catch (const std::exception& e) {
        logger.error("Error loading config from {}: {}", config_file.string(), e.what());
        return false;
    }
}

bool Config::parse_json(const std::string& json_str) {
    try {
        nlohmann::json j = nlohmann::json::parse(json_str);

        // Рекурсивно обходим JSON, вложенные объекты -> ключи через точку
        std::function<void(const std::string&, const nlohmann::json&)> parse_object;
        parse_object = [&](const std::string& prefix, const nlohmann::json& obj) {
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                if (it.value().is_object()) {
                    parse_object(key, it.value());
                } else if (it.value().is_string()) {
                    set(key, it.value().get<std::string>());
                } else if (it.value().is_boolean()) {
                    set(key, it.value().get<bool>());
                } else if (it.value().is_number_integer()) {
                    set(key, it.value().get<int>());
                } else if (it.value().is_number_float()) {
                    set(key, it.value().get<double>());
                } else {
                    logger.warning("Ignoring unsupported value for key: {}", key);
                }
            }
        };

        parse_object("", j);
        logger.info("Configuration loaded from JSON");
        return true;

    } catch (const nlohmann::json::exception& e) {
        logger.error("JSON parsing error: {}", e.what());
        return false;
    }
}

std::string Config::to_json() const {
    nlohmann::json j = nlohmann::json::object();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : values_) {
        std::vector<std::string> parts;
        std::stringstream ss(key);
        std::string part;

        while (std::getline(ss, part, '.')) {
            parts.push_back(part);
        }
        if (parts.empty()) {
            continue;
        }

        nlohmann::json* current = &j;
        for (size_t i = 0; i < parts.size() - 1; ++i) {
            if (!current->contains(parts[i])) {
                (*current)[parts[i]] = nlohmann::json::object();
            }
            current = &(*current)[parts[i]];
        }

        std::visit([&](const auto& val) {
            (*current)[parts.back()] = val;
        }, value);
    }

    return j.dump(2);
}

bool Config::save_to_file(const fs::path& config_file) const {
    try {
        if (config_file.has_parent_path()) {
            fs::create_directories(config_file.parent_path());
        }

        std::ofstream file(config_file);
        if (!file.is_open()) {
            logger.error("Failed to open config file for writing: {}",
                         config_file.string());
            return false;
        }

        file << to_json();
        logger.info("Configuration saved to: {}", config_file.string());
        return true;

    } catch (const std::exception& e) {
        logger.error("Error saving config to {}: {}", config_file.string(), e.what());
        return false;
    }
}

void Config::attach_bus(EventBus* bus) {
    std::lock_guard<std::mutex> lock(mutex_);
    bus_ = bus;
}

void Config::verify() const {
    verify_host(get_or<std::string>("mythtv.host", ""));
    verify_port(get_or<int>("mythtv.port", 0));
    logger.debug("Verified settings");
}

void Config::verify_host(const std::string& host) {
    if (host.find_first_not_of(" \t") == std::string::npos) {
        throw SettingsError("Enter MythTV master backend hostname or IP address");
    }

    boost::asio::io_context io;
    boost::asio::ip::tcp::resolver resolver(io);
    boost::system::error_code ec;
    // Без address_configured: на машине только с loopback адрес тоже годится
    auto endpoints = resolver.resolve(host, "", boost::asio::ip::resolver_base::flags(), ec);
    if (ec || endpoints.empty()) {
        logger.debug("Resolving {} failed: {}", host, ec.message());
        throw SettingsError(fmt::format("Hostname '{}' cannot be resolved to an IP address.", host));
    }
}

void Config::verify_port(int port) {
    if (port < 1 || port > 65535) {
        throw SettingsError(fmt::format(
            "Enter MythTV master backend port. Hint: {} is the MythTV default", MLINK_DEFAULT_PORT));
    }
}

std::string Config::backend_host() const {
    return get_or<std::string>("mythtv.host", Defaults::HOST);
}

uint16_t Config::backend_port() const {
    int port = get_or<int>("mythtv.port", Defaults::PORT);
    verify_port(port);
    return static_cast<uint16_t>(port);
}

std::string Config::client_hostname() const {
    auto name = get_or<std::string>("client.hostname", "");
    if (!name.empty()) {
        return name;
    }
    return boost::asio::ip::host_name();
}

} // namespace ml
