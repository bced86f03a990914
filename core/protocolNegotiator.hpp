#pragma once

#include <map>
#include <atomic>
#include <memory>
#include <string>
#include <optional>

#include "../include/domain.hpp"
#include "../sdk/types.h"

namespace ml {

class MessageChannel;

/**
 * @brief Поведение, зависящее от версии протокола бэкенда.
 */
class Protocol {
public:
    virtual ~Protocol() = default;

    virtual int version() const = 0;

    // Число токенов в одной записи программы
    virtual size_t record_size() const = 0;

    // Команда ANN FileTransfer для этой версии
    virtual Tokens announce_file_transfer(const std::string& client_host,
                                          const std::string& path) const = 0;
};

/**
 * @brief Таблица поддерживаемых версий протокола.
 *
 * Заполняется один раз при старте, дальше только читается.
 */
class ProtocolRegistry {
public:
    ProtocolRegistry() = default;

    // Версии 40..56
    static std::shared_ptr<const ProtocolRegistry> with_defaults();

    void add(std::unique_ptr<Protocol> protocol);

    const Protocol* find(int version) const;

    // Неизвестная версия -> ProtocolError
    const Protocol& resolve(int version) const;

    size_t size() const { return protocols_.size(); }

private:
    std::map<int, std::unique_ptr<Protocol>> protocols_;
};

/**
 * @brief Версия протокола сервера, узнанная первым соединением.
 *
 * Последующие соединения берут её отсюда и не зондируют сервер повторно.
 */
class VersionCache {
public:
    std::optional<int> get() const;
    void store(int version);
    void reset();

private:
    std::atomic<int> version_{0};
};

/**
 * @brief Согласование версии протокола (MYTH_PROTO_VERSION).
 */
class ProtocolNegotiator {
public:
    ProtocolNegotiator(const ProtocolRegistry& registry,
                       VersionCache& cache,
                       int init_version = MLINK_INIT_PROTOCOL_VERSION);

    /**
     * @brief Версия сервера.
     *
     * Если версия уже в кэше, возвращает её, ничего не отправляя. Иначе
     * отправляет заведомо старую init_version, сервер отвечает отказом со
     * своей версией, которая и запоминается.
     */
    int server_version(MessageChannel& probe);

    /**
     * @brief Рукопожатие на конкретном сокете.
     *
     * @return версия сервера
     * @throws ProtocolError если версия сервера меньше client_version;
     *         ошибка несёт версию сервера
     */
    int negotiate(MessageChannel& channel, int client_version);

    const Protocol& resolve(int version) const;

private:
    const ProtocolRegistry& registry_;
    VersionCache& cache_;
    int init_version_;
};

} // namespace ml
