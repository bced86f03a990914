#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <memory>
#include <string>

#include "../sdk/cpp/stream.hpp"

namespace ml {

/**
 * @brief Блокирующий TCP поток на Boost.Asio.
 *
 * io_context принадлежит TcpConnector и должен жить дольше сокета.
 */
class TcpStream : public IStream {
public:
    TcpStream(boost::asio::io_context& io_context, std::string peer);
    ~TcpStream() override;

    void connect(const boost::asio::ip::tcp::resolver::results_type& endpoints);

    size_t read_some(void* data, size_t size) override;
    void write_all(const void* data, size_t size) override;
    void close() override;
    bool is_open() const override;
    std::string peer() const override { return peer_; }

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

private:
    boost::asio::ip::tcp::socket socket_;
    std::string peer_;
};

class TcpConnector : public IStreamConnector {
public:
    TcpConnector();
    ~TcpConnector() override;

    std::unique_ptr<IStream> open(const std::string& host, uint16_t port) override;

    TcpConnector(const TcpConnector&) = delete;
    TcpConnector& operator=(const TcpConnector&) = delete;

private:
    boost::asio::io_context io_context_;
};

} // namespace ml
