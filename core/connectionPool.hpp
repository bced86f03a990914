#pragma once

#include <mutex>
#include <memory>
#include <vector>
#include <utility>

#include "../include/connection.hpp"
#include "../sdk/cpp/pool.hpp"

namespace ml {

/**
 * @brief Создаёт и уничтожает соединения для пула.
 */
class ConnectionFactory {
public:
    explicit ConnectionFactory(ConnectionContext context);
    virtual ~ConnectionFactory() = default;

    virtual std::unique_ptr<Connection> create();

    // Закрывает соединение (DONE + shutdown)
    virtual void destroy(Connection& conn);

    const ConnectionContext& context() const { return context_; }

private:
    ConnectionContext context_;
};

/**
 * @brief Простой пул: список свободных соединений под мьютексом.
 *
 * Владеет всеми выданными соединениями. Деструктор закрывает все.
 */
class BasicConnectionPool : public IConnectionPool {
public:
    explicit BasicConnectionPool(std::unique_ptr<ConnectionFactory> factory);
    ~BasicConnectionPool() override;

    BasicConnectionPool(const BasicConnectionPool&) = delete;
    BasicConnectionPool& operator=(const BasicConnectionPool&) = delete;

    Connection& checkout() override;
    void checkin(Connection& conn) override;
    void destroy(Connection& conn) override;

    size_t size() const;
    size_t idle() const;

private:
    std::unique_ptr<ConnectionFactory> factory_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Connection>> all_;
    std::vector<Connection*> idle_;
};

/**
 * @brief Привязка соединения из пула к текущему потоку на время области.
 *
 * Если поток уже держит соединение из этого пула (вложенный вызов), оно
 * используется повторно без checkout. Иначе соединение берётся из пула и
 * запоминается в thread-local хранилище. Вернуть его в пул может только
 * тот объект, который его взял; это делается в деструкторе, в том числе
 * при выходе по исключению.
 */
class ScopedConnection {
public:
    explicit ScopedConnection(IConnectionPool& pool);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    Connection& get() const { return *conn_; }
    Connection& operator*() const { return *conn_; }
    Connection* operator->() const { return conn_; }

    // Этот объект взял соединение из пула и вернёт его
    bool owns() const { return owner_; }

    // Соединение, привязанное к вызывающему потоку, или nullptr
    static Connection* current(const IConnectionPool& pool);

private:
    IConnectionPool& pool_;
    Connection* conn_ = nullptr;
    bool owner_ = false;
};

// Вызов func(Connection&) с соединением, привязанным к потоку
template<typename Func>
decltype(auto) with_connection(IConnectionPool& pool, Func&& func) {
    ScopedConnection conn(pool);
    return std::forward<Func>(func)(conn.get());
}

} // namespace ml
