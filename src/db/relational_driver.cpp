#include "db/relational_driver.hpp"
#include "db/pooled_connection.hpp"
#include "db/schema_constants.hpp"
#include "db/statement_classifier.hpp"
#include "db/value_coercion.hpp"
#include "core/utils.hpp"
#include <format>

namespace polydb {

RelationalDriver::RelationalDriver(std::shared_ptr<IConnectionPool> pool,
                                   std::chrono::milliseconds acquire_timeout)
    : pool_(std::move(pool)), acquire_timeout_(acquire_timeout) {}

RelationalDriver::~RelationalDriver() {
    if (pool_) {
        pool_->drain();
    }
}

Result<QueryResult> RelationalDriver::execute_query(
    const std::string& statement, const std::optional<std::string>& /*database*/) {

    const utils::Timer timer;

    if (utils::trim(statement).empty()) {
        return Result<QueryResult>::ok(QueryResult::with_message(std::string(db::kEmptyQuery)));
    }

    auto conn = pool_->acquire(acquire_timeout_);
    if (!conn) {
        return Result<QueryResult>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Query failed: {}", pool_->last_error()));
    }

    const bool write_only = StatementClassifier::is_write_only(statement);
    DbResultSet rs = (*conn)->execute(statement);
    if (!rs.success) {
        return Result<QueryResult>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Query failed: {}", rs.error_message));
    }

    QueryResult result;
    if (write_only) {
        result.message = std::format("{} row(s) affected.", rs.affected_rows);
    } else if (rs.rows.empty()) {
        result.message = std::string(db::kNoRows);
    } else {
        result.columns = std::move(rs.column_names);
        result.rows.reserve(rs.rows.size());
        for (const auto& raw_row : rs.rows) {
            std::vector<Value> row;
            row.reserve(raw_row.size());
            for (size_t i = 0; i < raw_row.size(); ++i) {
                row.push_back(ValueCoercion::coerce(raw_row[i], rs.column_types[i]));
            }
            result.rows.push_back(std::move(row));
        }
        result.row_count = result.rows.size();
    }

    result.execution_time_ms = static_cast<uint64_t>(timer.elapsed_ms().count());
    return Result<QueryResult>::ok(std::move(result));
}

Status RelationalDriver::select_database(const std::string& /*database*/) {
    return Status::error(ErrorCode::UNSUPPORTED_OPERATION, unsupported("In-place database switch"));
}

Result<DbResultSet> RelationalDriver::run(std::string_view action, const SqlBuilder& build_sql) {
    auto conn = pool_->acquire(acquire_timeout_);
    if (!conn) {
        return Result<DbResultSet>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Failed to {}: {}", action, pool_->last_error()));
    }

    const std::string sql = build_sql(**conn);
    utils::log::debug(std::format("[{}] {}", pool_->name(), sql));

    DbResultSet rs = (*conn)->execute(sql);
    if (!rs.success) {
        return Result<DbResultSet>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Failed to {}: {}", action, rs.error_message));
    }
    return Result<DbResultSet>::ok(std::move(rs));
}

Result<NameList> RelationalDriver::run_names(std::string_view action, const SqlBuilder& build_sql) {
    auto rs = run(action, build_sql);
    if (rs.is_error()) {
        return Result<NameList>::propagate(rs);
    }

    NameList names;
    names.reserve(rs.value().rows.size());
    for (const auto& row : rs.value().rows) {
        names.push_back(cell_text(row, 0));
    }
    return Result<NameList>::ok(std::move(names));
}

std::string RelationalDriver::unsupported(std::string_view what) const {
    return std::format("{} is not supported for {}", what, database_type_to_string(type()));
}

std::string cell_text(const std::vector<RawCell>& row, size_t index) {
    if (index >= row.size() || !row[index]) {
        return "";
    }
    return *row[index];
}

std::optional<std::string> cell_optional(const std::vector<RawCell>& row, size_t index) {
    if (index >= row.size()) {
        return std::nullopt;
    }
    return row[index];
}

bool cell_flag(const std::vector<RawCell>& row, size_t index) {
    if (index >= row.size() || !row[index]) {
        return false;
    }
    return ValueCoercion::parse_bool(*row[index]).value_or(false);
}

} // namespace polydb
