#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace litesync {

/**
 * @brief Abstract factory for creating store connections
 *
 * The SQLite backend opens the file at the given path and applies the
 * configured pragmas. Tests substitute factories that fail on demand.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new store connection
     * @param path Store file path
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& path) = 0;
};

} // namespace litesync
