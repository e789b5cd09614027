#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <format>

namespace polydb {

namespace {

// libpq diagnostics end with a newline
std::string pg_message(const char* raw) {
    return utils::trim(raw ? raw : "");
}

void append_conninfo(std::string& out, std::string_view key, std::string_view value) {
    if (!out.empty()) {
        out += ' ';
    }
    out += key;
    out += "='";
    for (const char c : value) {
        if (c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '\'';
}

} // namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    PGresult* res = PQexec(conn_, sql.c_str());

    if (!res) {
        return DbResultSet::failure(pg_message(PQerrorMessage(conn_)));
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    // Error case
    std::string error = pg_message(PQresultErrorMessage(res));
    PQclear(res);
    return DbResultSet::failure(std::move(error));
}

std::string PgConnection::quote_literal(std::string_view value) {
    if (conn_) {
        char* escaped = PQescapeLiteral(conn_, value.data(), value.size());
        if (escaped) {
            std::string out(escaped);
            PQfreemem(escaped);
            return out;
        }
    }

    // Standard-conforming strings: doubling quotes is sufficient
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'') {
            out += '\'';
        }
        out += c;
    }
    out += '\'';
    return out;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
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

    const int ncols = PQnfields(res);
    result.column_names.reserve(ncols);
    result.column_types.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
        result.column_types.push_back(PgTypeMap::from_oid(static_cast<uint32_t>(PQftype(res, i))));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<RawCell> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                                             static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    result.affected_rows = static_cast<uint64_t>(nrows);
    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected) {
        result.affected_rows = utils::parse_int<uint64_t>(affected, 0);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        return Result<std::unique_ptr<IDbConnection>>::error(ErrorCode::CONNECT_ERROR,
            "Failed to connect to PostgreSQL: out of memory allocating PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = std::format("Failed to connect to PostgreSQL: {}",
            pg_message(PQerrorMessage(conn)));
        PQfinish(conn);
        return Result<std::unique_ptr<IDbConnection>>::error(ErrorCode::CONNECT_ERROR, std::move(error));
    }

    return Result<std::unique_ptr<IDbConnection>>::ok(std::make_unique<PgConnection>(conn));
}

std::string PgConnectionFactory::build_conninfo(const ConnectionDescriptor& descriptor,
                                                std::chrono::milliseconds connect_timeout) {
    std::string out;
    append_conninfo(out, "host", descriptor.host);
    if (descriptor.port != 0) {
        append_conninfo(out, "port", std::to_string(descriptor.port));
    }
    append_conninfo(out, "user", descriptor.username);
    if (!descriptor.password.empty()) {
        append_conninfo(out, "password", descriptor.password);
    }
    append_conninfo(out, "dbname", descriptor.database.value_or("postgres"));

    // Whole seconds, rounded up; 0 would mean no limit
    const auto seconds = (connect_timeout.count() + 999) / 1000;
    if (seconds > 0) {
        append_conninfo(out, "connect_timeout", std::to_string(seconds));
    }
    append_conninfo(out, "application_name", "polydb");
    return out;
}

} // namespace polydb
