#include "connectionPool.hpp"
#include "../include/logger.hpp"
#include "../include/errors.hpp"

#include <algorithm>
#include <unordered_map>

namespace ml {

LOGGER("INJECT");

namespace {

using Bindings = std::unordered_map<const IConnectionPool*, Connection*>;

// Соединения, привязанные к текущему потоку, по пулу
Bindings& thread_bindings() {
    thread_local Bindings bindings;
    return bindings;
}

} // namespace

ConnectionFactory::ConnectionFactory(ConnectionContext context)
    : context_(std::move(context)) {}

std::unique_ptr<Connection> ConnectionFactory::create() {
    return std::make_unique<Connection>(context_);
}

void ConnectionFactory::destroy(Connection& conn) {
    conn.close();
}

BasicConnectionPool::BasicConnectionPool(std::unique_ptr<ConnectionFactory> factory)
    : factory_(std::move(factory)) {
    if (!factory_) {
        throw ClientError("BasicConnectionPool requires a factory");
    }
}

BasicConnectionPool::~BasicConnectionPool() {
    std::vector<std::unique_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections.swap(all_);
        idle_.clear();
    }

    for (auto& conn : connections) {
        try {
            factory_->destroy(*conn);
        } catch (const std::exception& e) {
            logger.error("Failed to destroy pooled connection: {}", e.what());
        }
    }
}

Connection& BasicConnectionPool::checkout() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            Connection* conn = idle_.back();
            idle_.pop_back();
            logger.trace("checkout: reusing idle connection ({} idle left)", idle_.size());
            return *conn;
        }
    }

    // Рукопожатие с бэкендом идёт вне блокировки
    std::unique_ptr<Connection> created = factory_->create();
    Connection& conn = *created;

    std::lock_guard<std::mutex> lock(mutex_);
    all_.push_back(std::move(created));
    logger.debug("checkout: new connection ({} total)", all_.size());
    return conn;
}

void BasicConnectionPool::checkin(Connection& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto owned = std::find_if(all_.begin(), all_.end(),
                              [&conn](const auto& p) { return p.get() == &conn; });
    if (owned == all_.end()) {
        throw ClientError("checkin: connection does not belong to this pool");
    }
    if (std::find(idle_.begin(), idle_.end(), &conn) != idle_.end()) {
        throw ClientError("checkin: connection is already idle");
    }
    idle_.push_back(&conn);
    logger.trace("checkin: {} idle", idle_.size());
}

void BasicConnectionPool::destroy(Connection& conn) {
    std::unique_ptr<Connection> victim;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto owned = std::find_if(all_.begin(), all_.end(),
                                  [&conn](const auto& p) { return p.get() == &conn; });
        if (owned == all_.end()) {
            throw ClientError("destroy: connection does not belong to this pool");
        }
        victim = std::move(*owned);
        all_.erase(owned);
        std::erase(idle_, &conn);
    }

    factory_->destroy(*victim);
    logger.debug("destroy: connection removed from pool");
}

size_t BasicConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return all_.size();
}

size_t BasicConnectionPool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

ScopedConnection::ScopedConnection(IConnectionPool& pool)
    : pool_(pool) {
    Bindings& bindings = thread_bindings();

    // Только одно соединение на поток
    auto it = bindings.find(&pool_);
    if (it != bindings.end() && it->second) {
        conn_ = it->second;
        owner_ = false;
        logger.debug("Skipping checkout, thread already holds a connection");
        return;
    }

    conn_ = &pool_.checkout();
    owner_ = true;
    bindings[&pool_] = conn_;
    logger.debug("--> bound connection {} to thread", static_cast<const void*>(conn_));
}

ScopedConnection::~ScopedConnection() {
    if (!owner_) {
        return;
    }

    thread_bindings().erase(&pool_);
    logger.debug("--> released connection {} from thread", static_cast<const void*>(conn_));
    try {
        pool_.checkin(*conn_);
    } catch (const std::exception& e) {
        logger.error("checkin failed: {}", e.what());
    }
}

Connection* ScopedConnection::current(const IConnectionPool& pool) {
    const Bindings& bindings = thread_bindings();
    auto it = bindings.find(&pool);
    return it == bindings.end() ? nullptr : it->second;
}

} // namespace ml
