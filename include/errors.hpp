#pragma once

#include <string>
#include <stdexcept>
#include <boost/system/error_code.hpp>

namespace ml {

/**
 * @brief Базовый класс ошибок предметной области.
 *
 * Клиент, бэкенд или протокол повели себя не так, как ожидалось. Соединение
 * при этом остаётся пригодным, вызывающий код может показать ошибку пользователю.
 */
class BackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Некорректное использование API на стороне клиента.
class ClientError : public BackendError {
public:
    using BackendError::BackendError;
};

/// Бэкенд явно отказал или вернул признак ошибки.
class ServerError : public BackendError {
public:
    using BackendError::BackendError;
};

/// Несовпадение версий, неподдерживаемая версия или неожиданный формат ответа.
class ProtocolError : public BackendError {
public:
    explicit ProtocolError(const std::string& message, int protocol_version = -1)
        : BackendError(message), protocol_version_(protocol_version) {}

    // Версия протокола, которую сообщил сервер, -1 если не известна
    int protocol_version() const { return protocol_version_; }
    bool has_protocol_version() const { return protocol_version_ >= 0; }

private:
    int protocol_version_;
};

/**
 * @brief Сбой ввода-вывода на сокете или неожиданное закрытие соединения.
 *
 * Не наследуется от BackendError: перехват ошибок предметной области
 * не должен скрывать обрыв транспорта.
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message, boost::system::error_code ec = {})
        : std::runtime_error(ec ? message + ": " + ec.message() : message), code_(ec) {}

    const boost::system::error_code& code() const { return code_; }

private:
    boost::system::error_code code_;
};

/// Значение настройки не прошло проверку.
class SettingsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ml
