#include "fileTransfer.hpp"
#include "messageChannel.hpp"
#include "longLong.hpp"
#include "../include/logger.hpp"
#include "../include/errors.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ml {

LOGGER("TRANSFER");

namespace {
    // Размер одного чтения из сокета данных
    constexpr size_t kReadChunk = 64 * 1024;
}

FileTransferHandle parse_announce_reply(const Tokens& reply) {
    if (!is_ok(reply)) {
        throw ServerError(fmt::format("Backend filetransfer refused: [{}]", fmt::join(reply, ", ")));
    }
    if (reply.size() < 4) {
        throw ProtocolError(fmt::format(
            "Short filetransfer announce reply: [{}]", fmt::join(reply, ", ")));
    }

    FileTransferHandle handle;
    handle.id = reply[1];
    handle.size = longlong::decode(reply[3], reply[2]);
    return handle;
}

FileTransfer::FileTransfer(MessageChannel& command,
                           MessageChannel& data,
                           FileTransferHandle handle,
                           size_t max_block_size)
    : command_(command),
      data_(data),
      handle_(std::move(handle)),
      max_block_size_(max_block_size),
      buffer_(std::min(max_block_size, kReadChunk)) {
    if (max_block_size_ == 0) {
        throw ClientError("File transfer block size must be positive");
    }
}

uint64_t FileTransfer::run(const Sink& sink) {
    logger.info("Transfer {} started: {} bytes in blocks of {}",
                handle_.id, handle_.size, max_block_size_);

    uint64_t remaining = handle_.size;
    while (remaining > 0) {
        size_t block_size = static_cast<size_t>(
            std::min<uint64_t>(remaining, max_block_size_));

        command_.send({ fmt::format("QUERY_FILETRANSFER {}", handle_.id),
                        "REQUEST_BLOCK",
                        std::to_string(block_size) });
        ++blocks_;

        receive_block(block_size, sink);

        // Один ответ на блок, иначе командный сокет рассинхронизируется
        Tokens ack = command_.receive();
        logger.trace("block {} ack: [{}]", blocks_, fmt::join(ack, ", "));

        remaining -= block_size;
    }

    logger.info("Transfer {} finished: {} blocks", handle_.id, blocks_);
    return handle_.size;
}

void FileTransfer::receive_block(size_t block_size, const Sink& sink) {
    size_t received = 0;
    while (received < block_size) {
        size_t wanted = std::min(buffer_.size(), block_size - received);
        size_t n = data_.stream().read_some(buffer_.data(), wanted);
        if (n == 0) {
            throw TransportError(fmt::format(
                "Data socket {} closed after {} of {} bytes of block {}",
                data_.peer(), received, block_size, blocks_));
        }
        logger.trace("received {} bytes", n);
        sink(buffer_.data(), n);
        received += n;
    }
}

} // namespace ml
