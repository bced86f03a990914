#include "messageChannel.hpp"
#include "../include/logger.hpp"
#include "../include/errors.hpp"
#include "../sdk/types.h"

#include <array>
#include <cctype>
#include <charconv>
#include <algorithm>
#include <fmt/format.h>

namespace ml {

LOGGER("WIRE");

namespace {
    constexpr std::string_view kSeparator = MLINK_SEPARATOR;
    constexpr size_t kLogPreview = 80;

    std::string_view preview(std::string_view s) {
        return s.substr(0, std::min(s.size(), kLogPreview));
    }

    std::string_view trim(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.remove_suffix(1);
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.remove_prefix(1);
        }
        return s;
    }

    bool is_short_ok(std::string_view header) {
        std::string_view t = trim(header);
        return t.size() == 2
            && std::toupper(static_cast<unsigned char>(t[0])) == 'O'
            && std::toupper(static_cast<unsigned char>(t[1])) == 'K';
    }
}

MessageChannel::MessageChannel(std::unique_ptr<IStream> stream)
    : stream_(std::move(stream)) {
    if (!stream_) {
        throw ClientError("MessageChannel requires a stream");
    }
}

MessageChannel::~MessageChannel() {
    close();
}

std::string MessageChannel::frame(const Tokens& tokens) {
    std::string payload;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            payload += kSeparator;
        }
        payload += tokens[i];
    }
    return fmt::format("{:<8}{}", payload.size(), payload);
}

Tokens MessageChannel::split(std::string_view payload) {
    Tokens tokens;
    size_t start = 0;
    while (true) {
        size_t pos = payload.find(kSeparator, start);
        if (pos == std::string_view::npos) {
            tokens.emplace_back(payload.substr(start));
            break;
        }
        tokens.emplace_back(payload.substr(start, pos - start));
        start = pos + kSeparator.size();
    }
    return tokens;
}

void MessageChannel::send(const Tokens& tokens) {
    std::string message = frame(tokens);
    logger.trace("write -> {}", preview(message));
    // Заголовок и нагрузка уходят одной записью
    stream_->write_all(message.data(), message.size());
}

Tokens MessageChannel::receive() {
    std::array<char, MLINK_LENGTH_FIELD_SIZE> header{};
    size_t got = read_up_to(header.data(), header.size());
    std::string_view header_view(header.data(), got);

    if (is_short_ok(header_view)) {
        logger.trace("read  <- OK (short reply)");
        return { "OK" };
    }

    if (got < header.size()) {
        throw TransportError(fmt::format(
            "Connection to {} closed while reading reply header ({} of {} bytes)",
            peer(), got, header.size()));
    }

    std::string_view digits = trim(header_view);
    size_t length = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), length);
    if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
        throw ProtocolError(fmt::format("Malformed reply header: '{}'", header_view));
    }

    std::string payload(length, '\0');
    read_exact(payload.data(), length);

    logger.trace("read  <- [{}] {}", length, preview(payload));
    return split(payload);
}

Tokens MessageChannel::request(const Tokens& tokens) {
    send(tokens);
    return receive();
}

void MessageChannel::read_exact(char* data, size_t size) {
    size_t got = read_up_to(data, size);
    if (got < size) {
        throw TransportError(fmt::format(
            "Connection to {} closed after {} of {} bytes", peer(), got, size));
    }
}

size_t MessageChannel::read_up_to(char* data, size_t size) {
    size_t total = 0;
    while (total < size) {
        size_t n = stream_->read_some(data + total, size - total);
        if (n == 0) {
            break; // eof
        }
        total += n;
    }
    return total;
}

void MessageChannel::close() {
    if (stream_) {
        stream_->close();
    }
}

bool MessageChannel::is_open() const {
    return stream_ && stream_->is_open();
}

std::string MessageChannel::peer() const {
    return stream_ ? stream_->peer() : std::string("<closed>");
}

} // namespace ml
