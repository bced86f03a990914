#include "protocolNegotiator.hpp"
#include "messageChannel.hpp"
#include "../include/logger.hpp"
#include "../include/errors.hpp"

#include <charconv>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ml {

LOGGER("WIRE");

namespace {

// Первая версия, в которой ANN FileTransfer несёт группу хранения
constexpr int kStorageGroupVersion = 44;

class BackendProtocol : public Protocol {
public:
    BackendProtocol(int version, size_t record_size)
        : version_(version), record_size_(record_size) {}

    int version() const override { return version_; }
    size_t record_size() const override { return record_size_; }

    Tokens announce_file_transfer(const std::string& client_host,
                                  const std::string& path) const override {
        Tokens command{ fmt::format("ANN FileTransfer {}", client_host), path };
        if (version_ >= kStorageGroupVersion) {
            command.emplace_back("Default");
        }
        return command;
    }

private:
    int version_;
    size_t record_size_;
};

int parse_version(const Tokens& reply) {
    if (reply.size() < 2) {
        throw ProtocolError(fmt::format(
            "Unexpected MYTH_PROTO_VERSION reply: [{}]", fmt::join(reply, ", ")));
    }
    const std::string& token = reply[1];
    int version = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), version);
    if (token.empty() || ec != std::errc() || ptr != token.data() + token.size()) {
        throw ProtocolError(fmt::format("Server sent a non-numeric protocol version: '{}'", token));
    }
    return version;
}

} // namespace

std::shared_ptr<const ProtocolRegistry> ProtocolRegistry::with_defaults() {
    auto registry = std::make_shared<ProtocolRegistry>();
    registry->add(std::make_unique<BackendProtocol>(40, 46));
    for (int version = 41; version <= 56; ++version) {
        registry->add(std::make_unique<BackendProtocol>(version, 47));
    }
    return registry;
}

void ProtocolRegistry::add(std::unique_ptr<Protocol> protocol) {
    if (!protocol) {
        throw ClientError("Cannot register a null protocol");
    }
    int version = protocol->version();
    protocols_[version] = std::move(protocol);
}

const Protocol* ProtocolRegistry::find(int version) const {
    auto it = protocols_.find(version);
    return it == protocols_.end() ? nullptr : it->second.get();
}

const Protocol& ProtocolRegistry::resolve(int version) const {
    const Protocol* protocol = find(version);
    if (!protocol) {
        throw ProtocolError(fmt::format("Unsupported protocol: {}", version), version);
    }
    return *protocol;
}

std::optional<int> VersionCache::get() const {
    int version = version_.load(std::memory_order_acquire);
    if (version <= 0) {
        return std::nullopt;
    }
    return version;
}

void VersionCache::store(int version) {
    version_.store(version, std::memory_order_release);
}

void VersionCache::reset() {
    version_.store(0, std::memory_order_release);
}

ProtocolNegotiator::ProtocolNegotiator(const ProtocolRegistry& registry,
                                       VersionCache& cache,
                                       int init_version)
    : registry_(registry), cache_(cache), init_version_(init_version) {}

int ProtocolNegotiator::server_version(MessageChannel& probe) {
    if (auto cached = cache_.get()) {
        return *cached;
    }

    // Старая версия заставляет сервер ответить REJECT со своей версией
    Tokens reply = probe.request({ fmt::format("MYTH_PROTO_VERSION {}", init_version_) });
    int version = parse_version(reply);
    logger.debug("server_version: {} {}", reply[0], version);

    cache_.store(version);
    return version;
}

int ProtocolNegotiator::negotiate(MessageChannel& channel, int client_version) {
    Tokens reply = channel.request({ fmt::format("MYTH_PROTO_VERSION {}", client_version) });
    int server = parse_version(reply);
    logger.debug("negotiate: {} -> {} {}", client_version, reply[0], server);

    if (server < client_version) {
        throw ProtocolError(fmt::format(
            "Protocol mismatch - Server protocol version: {}  Client protocol version: {}",
            server, client_version), server);
    }
    return server;
}

const Protocol& ProtocolNegotiator::resolve(int version) const {
    return registry_.resolve(version);
}

} // namespace ml
