#pragma once
#include "../types.h"

#include <string>
#include <memory>
#include <cstdint>

namespace ml {

/**
 * @brief Двунаправленный байтовый поток до бэкенда.
 *
 * Все операции блокирующие. Ошибки сокета сообщаются через TransportError.
 */
class IStream {
public:
    virtual ~IStream() = default;

    // Читает не больше size байт. 0 означает, что удалённая сторона закрыла поток.
    virtual size_t read_some(void* data, size_t size) = 0;

    // Отправляет буфер целиком
    virtual void write_all(const void* data, size_t size) = 0;

    // shutdown + close, повторный вызов ничего не делает
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    // "host:port" для логов
    virtual std::string peer() const = 0;
};

/**
 * @brief Фабрика потоков: открывает новое TCP соединение к host:port.
 */
class IStreamConnector {
public:
    virtual ~IStreamConnector() = default;

    virtual std::unique_ptr<IStream> open(const std::string& host, uint16_t port) = 0;
};

}  /* namespace ml */
