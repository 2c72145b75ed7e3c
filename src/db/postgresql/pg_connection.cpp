#include "db/postgresql/pg_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace sqlmemo {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const std::vector<Value>& parameters) {
    DbResultSet failed;
    if (!conn_) {
        failed.error_message = "Connection is null";
        return failed;
    }

    // Text-format parameters; the strings must outlive PQexecParams
    std::vector<std::string> texts;
    std::vector<const char*> values;
    texts.reserve(parameters.size());
    values.reserve(parameters.size());
    for (const auto& p : parameters) {
        if (is_null(p)) {
            texts.emplace_back();
            values.push_back(nullptr);
            continue;
        }
        if (!is_scalar(p)) {
            failed.error_message = std::format("Cannot bind a {} parameter", value_type_name(p));
            return failed;
        }
        texts.push_back(value_to_string(p));
        values.push_back(texts.back().c_str());
    }

    PGresult* res = PQexecParams(conn_, sql.c_str(),
                                 static_cast<int>(values.size()),
                                 nullptr,                // let the server infer types
                                 values.data(),
                                 nullptr, nullptr,       // text format
                                 0);                     // text results

    if (!res) {
        failed.error_message = PQerrorMessage(conn_);
        return failed;
    }

    ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    // Error case
    failed.error_message = PQresultErrorMessage(res);
    PQclear(res);
    return failed;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));
    }

    int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::optional<std::string>> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j), PQgetlength(res, i, j)));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoull(affected);
    }

    return result;
}

// ============================================================================
// PgDataSource
// ============================================================================

PgDataSource::PgDataSource(std::string connection_string)
    : connection_string_(std::move(connection_string)) {}

std::unique_ptr<IDbConnection> PgDataSource::get_connection() {
    PGconn* conn = PQconnectdb(connection_string_.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        throw DataAccessError("Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        const std::string message = PQerrorMessage(conn);
        utils::log::error(std::format("Failed to connect to {}: {}", describe(), message));
        PQfinish(conn);
        throw DataAccessError(std::format("Failed to connect to {}: {}", describe(), message));
    }

    return std::make_unique<PgConnection>(conn);
}

std::string PgDataSource::describe() const {
    // Report host/dbname only; the connection string may carry a password
    PQconninfoOption* options = PQconninfoParse(connection_string_.c_str(), nullptr);
    if (!options) return "postgresql";

    std::string host = "localhost";
    std::string dbname;
    for (auto* opt = options; opt->keyword; ++opt) {
        if (!opt->val) continue;
        if (std::strcmp(opt->keyword, "host") == 0) host = opt->val;
        if (std::strcmp(opt->keyword, "dbname") == 0) dbname = opt->val;
    }
    PQconninfoFree(options);
    return std::format("postgresql://{}/{}", host, dbname);
}

} // namespace sqlmemo
