#pragma once

#include "db/idata_source.hpp"
#include "db/idb_connection.hpp"
#include <libpq-fe.h>
#include <string>

namespace sqlmemo {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here. Parameters are sent in text
 * format through PQexecParams ($1, $2, ... placeholders).
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, const std::vector<Value>& parameters) override;
    bool is_connected() const override;
    void close() override;

private:
    /**
     * @brief Process a SELECT result (PGRES_TUPLES_OK)
     */
    DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Process a command result (PGRES_COMMAND_OK)
     */
    DbResultSet process_command_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL data source
 *
 * Opens a new PgConnection per request using PQconnectdb.
 */
class PgDataSource : public IDataSource {
public:
    explicit PgDataSource(std::string connection_string);

    std::unique_ptr<IDbConnection> get_connection() override;
    std::string describe() const override;

private:
    std::string connection_string_;
};

} // namespace sqlmemo
