#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "../include/domain.hpp"
#include "../sdk/cpp/stream.hpp"

namespace ml {

/**
 * @brief Кадрирование сообщений протокола поверх IStream.
 *
 * Сообщение на проводе: 8 байт длины (десятичное число, выровненное влево
 * и дополненное пробелами) и полезная нагрузка, токены которой соединены
 * разделителем "[]:[]". Длина всегда равна числу байт нагрузки.
 *
 * Исключение из формата: заголовок, равный "OK" (без учёта регистра),
 * считается коротким ответом ["OK"] без нагрузки.
 */
class MessageChannel {
public:
    explicit MessageChannel(std::unique_ptr<IStream> stream);
    ~MessageChannel();

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    void send(const Tokens& tokens);
    Tokens receive();

    // send + receive, один запрос на сокет в каждый момент времени
    Tokens request(const Tokens& tokens);

    // Читает ровно size байт, закрытие потока раньше времени -> TransportError
    void read_exact(char* data, size_t size);

    IStream& stream() { return *stream_; }

    void close();
    bool is_open() const;
    std::string peer() const;

    static std::string frame(const Tokens& tokens);
    static Tokens split(std::string_view payload);

private:
    // Сколько байт удалось прочитать до закрытия потока
    size_t read_up_to(char* data, size_t size);

    std::unique_ptr<IStream> stream_;
};

} // namespace ml
