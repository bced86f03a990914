#include "tcpStream.hpp"
#include "../include/logger.hpp"
#include "../include/errors.hpp"

#include <fmt/format.h>

namespace ml {

using boost::asio::ip::tcp;

TcpStream::TcpStream(boost::asio::io_context& io_context, std::string peer)
    : socket_(io_context), peer_(std::move(peer)) {}

TcpStream::~TcpStream() {
    close();
}

void TcpStream::connect(const tcp::resolver::results_type& endpoints) {
    boost::system::error_code ec;
    boost::asio::connect(socket_, endpoints, ec);
    if (ec) {
        throw TransportError(fmt::format("Cannot connect to {}", peer_), ec);
    }

    // Короткие команды не должны ждать алгоритма Нейгла
    socket_.set_option(tcp::no_delay(true), ec);
    if (ec) {
        LOG_DEBUG("Cannot set TCP_NODELAY on {}: {}", peer_, ec.message());
    }
}

size_t TcpStream::read_some(void* data, size_t size) {
    boost::system::error_code ec;
    size_t n = socket_.read_some(boost::asio::buffer(data, size), ec);
    if (ec == boost::asio::error::eof) {
        return 0;
    }
    if (ec) {
        throw TransportError(fmt::format("Read from {} failed", peer_), ec);
    }
    return n;
}

void TcpStream::write_all(const void* data, size_t size) {
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(data, size), ec);
    if (ec) {
        throw TransportError(fmt::format("Write to {} failed", peer_), ec);
    }
}

void TcpStream::close() {
    if (!socket_.is_open()) {
        return;
    }

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        LOG_DEBUG("Socket shutdown error on {}: {}", peer_, ec.message());
    }
    socket_.close(ec);
    if (ec) {
        LOG_DEBUG("Socket close error on {}: {}", peer_, ec.message());
    }
}

bool TcpStream::is_open() const {
    return socket_.is_open();
}

TcpConnector::TcpConnector() = default;

TcpConnector::~TcpConnector() = default;

std::unique_ptr<IStream> TcpConnector::open(const std::string& host, uint16_t port) {
    std::string peer = fmt::format("{}:{}", host, port);

    tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw TransportError(fmt::format("Cannot resolve {}", peer), ec);
    }

    auto stream = std::make_unique<TcpStream>(io_context_, peer);
    stream->connect(endpoints);

    LOG_DEBUG("Connected to {}", peer);
    return stream;
}

} // namespace ml
