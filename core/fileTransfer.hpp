#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <functional>

#include "../include/domain.hpp"
#include "../sdk/types.h"

namespace ml {

class MessageChannel;

/**
 * @brief Удалённый дескриптор передачи файла из ответа на ANN FileTransfer.
 */
struct FileTransferHandle {
    std::string id;
    uint64_t size = 0;
};

// Ответ "OK", id, size_high, size_low. Не OK -> ServerError
FileTransferHandle parse_announce_reply(const Tokens& reply);

/**
 * @brief Побочная передача файла блоками.
 *
 * Запросы REQUEST_BLOCK идут через командный сокет, байты приходят по
 * отдельному сокету данных. На каждый блок командный сокет присылает
 * ровно один ответ, он читается после того, как весь блок получен.
 */
class FileTransfer {
public:
    // Получатель очередного куска данных
    using Sink = std::function<void(const char* data, size_t size)>;

    FileTransfer(MessageChannel& command,
                 MessageChannel& data,
                 FileTransferHandle handle,
                 size_t max_block_size = MLINK_MAX_BLOCK_SIZE);

    /**
     * @brief Забирает файл целиком.
     *
     * @return число переданных байт
     * @throws TransportError если сокет данных закрылся до конца блока
     */
    uint64_t run(const Sink& sink);

    const FileTransferHandle& handle() const { return handle_; }
    size_t blocks_requested() const { return blocks_; }

private:
    MessageChannel& command_;
    MessageChannel& data_;
    FileTransferHandle handle_;
    size_t max_block_size_;
    size_t blocks_ = 0;
    std::vector<char> buffer_;

    void receive_block(size_t block_size, const Sink& sink);
};

} // namespace ml
