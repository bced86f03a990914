#pragma once

namespace ml {

class Connection;

/**
 * @brief Пул соединений, на который опирается ScopedConnection.
 *
 * Хранение и вытеснение остаются на стороне реализации. Требуется только:
 *  - checkout(): свободное или новое соединение;
 *  - checkin(): вернуть соединение в пул;
 *  - destroy(): окончательно убрать соединение, вызвав Connection::close().
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    virtual Connection& checkout() = 0;
    virtual void checkin(Connection& conn) = 0;
    virtual void destroy(Connection& conn) = 0;
};

}  /* namespace ml */
