#include "db/sqlite/sqlite_connection.hpp"
#include "db/sqlite/sqlite_type_map.hpp"
#include <format>
#include <optional>
#include <vector>

namespace polydb {

namespace {

constexpr std::string_view kMemoryPath = ":memory:";

std::string_view strip_scheme(std::string_view path) {
    if (path.starts_with("sqlite://")) {
        path.remove_prefix(9);
    } else if (path.starts_with("sqlite:")) {
        path.remove_prefix(7);
    }
    return path;
}

RawCell read_cell(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_NULL:
            return std::nullopt;
        case SQLITE_FLOAT:
            // Shortest round-trip form; sqlite3_column_text keeps only 15 digits
            return std::format("{}", sqlite3_column_double(stmt, col));
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            const int size = sqlite3_column_bytes(stmt, col);
            if (!data || size <= 0) {
                return std::string{};
            }
            return std::string(data, static_cast<size_t>(size));
        }
        default: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            const int size = sqlite3_column_bytes(stmt, col);
            if (!text) {
                return std::string{};
            }
            return std::string(text, static_cast<size_t>(size));
        }
    }
}

} // namespace

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql) {
    if (!db_) {
        return DbResultSet::failure("Connection is closed");
    }

    DbResultSet result;
    result.success = true;

    const int changes_before = sqlite3_total_changes(db_);
    const char* tail = sql.c_str();
    const char* const end = tail + sql.size();

    while (tail < end) {
        sqlite3_stmt* stmt = nullptr;
        const char* next = nullptr;
        const int rc = sqlite3_prepare_v2(db_, tail, static_cast<int>(end - tail), &stmt, &next);
        if (rc != SQLITE_OK) {
            return DbResultSet::failure(sqlite3_errmsg(db_));
        }

        const bool advanced = next != nullptr && next != tail;
        tail = next != nullptr ? next : end;

        // Whitespace or a trailing comment compiles to no statement
        if (!stmt) {
            if (!advanced) {
                break;
            }
            continue;
        }

        DbResultSet current;
        const bool ok = collect_rows(stmt, current);
        sqlite3_finalize(stmt);
        if (!ok) {
            return DbResultSet::failure(std::move(current.error_message));
        }

        if (current.has_rows) {
            result.has_rows = true;
            result.column_names = std::move(current.column_names);
            result.column_types = std::move(current.column_types);
            result.rows = std::move(current.rows);
        }
    }

    if (result.has_rows) {
        result.affected_rows = result.rows.size();
    } else {
        result.affected_rows = static_cast<uint64_t>(sqlite3_total_changes(db_) - changes_before);
    }
    return result;
}

bool SqliteConnection::collect_rows(sqlite3_stmt* stmt, DbResultSet& out) {
    const int num_cols = sqlite3_column_count(stmt);
    out.has_rows = num_cols > 0;

    std::vector<std::optional<ColumnTypeInfo>> declared;
    declared.reserve(static_cast<size_t>(num_cols));
    out.column_names.reserve(static_cast<size_t>(num_cols));
    for (int i = 0; i < num_cols; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        out.column_names.emplace_back(name ? name : "");
        const char* decl = sqlite3_column_decltype(stmt, i);
        declared.push_back(decl ? SqliteTypeMap::from_declared(decl) : std::nullopt);
    }

    bool first_row = true;
    while (true) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            out.error_message = sqlite3_errmsg(db_);
            return false;
        }

        // Expression columns take the storage class of their first value
        if (first_row) {
            for (int i = 0; i < num_cols; ++i) {
                out.column_types.push_back(declared[static_cast<size_t>(i)]
                    ? *declared[static_cast<size_t>(i)]
                    : SqliteTypeMap::from_storage_class(sqlite3_column_type(stmt, i)));
            }
            first_row = false;
        }

        std::vector<RawCell> row;
        row.reserve(static_cast<size_t>(num_cols));
        for (int i = 0; i < num_cols; ++i) {
            row.push_back(read_cell(stmt, i));
        }
        out.rows.push_back(std::move(row));
    }

    if (first_row) {
        for (int i = 0; i < num_cols; ++i) {
            out.column_types.push_back(declared[static_cast<size_t>(i)]
                ? *declared[static_cast<size_t>(i)]
                : SqliteTypeMap::from_storage_class(SQLITE_NULL));
        }
    }
    return true;
}

std::string SqliteConnection::quote_literal(std::string_view value) {
    const std::string input(value);
    char* quoted = sqlite3_mprintf("%Q", input.c_str());
    if (!quoted) {
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
    std::string out(quoted);
    sqlite3_free(quoted);
    return out;
}

bool SqliteConnection::is_healthy(const std::string& health_check_query) {
    if (!db_) {
        return false;
    }
    if (health_check_query.empty()) {
        return true;
    }

    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db_, health_check_query.c_str(), nullptr, nullptr, &err_msg);
    if (err_msg) {
        sqlite3_free(err_msg);
    }
    return rc == SQLITE_OK;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

SqliteConnectionFactory::SqliteConnectionFactory(std::chrono::milliseconds busy_timeout)
    : busy_timeout_(busy_timeout) {}

Result<std::unique_ptr<IDbConnection>> SqliteConnectionFactory::create(
    const std::string& connection_string) {

    std::string path(strip_scheme(connection_string));
    if (path.empty()) {
        path = kMemoryPath;
    }

    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_URI;
    const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = std::format("Failed to connect to SQLite: {}",
            db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        sqlite3_close(db);
        return Result<std::unique_ptr<IDbConnection>>::error(ErrorCode::CONNECT_ERROR, std::move(error));
    }

    sqlite3_busy_timeout(db, static_cast<int>(busy_timeout_.count()));

    return Result<std::unique_ptr<IDbConnection>>::ok(std::make_unique<SqliteConnection>(db));
}

bool SqliteConnectionFactory::is_in_memory(std::string_view path) {
    path = strip_scheme(path);
    return path.empty()
        || path == kMemoryPath
        || path.find("mode=memory") != std::string_view::npos;
}

} // namespace polydb
