#pragma once

#include "core/database_type.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace polydb {

// ============================================================================
// Portable Value
// ============================================================================

/**
 * @brief The only value vocabulary that crosses the core boundary
 *
 * Backend-native types (timestamps, UUIDs, big numbers, maps, sets) are
 * always lowered into one of these alternatives before leaving a driver.
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

[[nodiscard]] inline bool is_null(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

// ============================================================================
// Connection Descriptor (supplied by the configuration collaborator)
// ============================================================================

struct ConnectionDescriptor {
    std::string id;
    std::string name;
    DatabaseType type = DatabaseType::POSTGRESQL;
    std::string host;
    uint16_t port = 0;
    std::string username;
    std::string password;
    std::optional<std::string> database;
};

// ============================================================================
// Schema Object Descriptors (read-only snapshots, one per introspection call)
// ============================================================================

struct ColumnInfo {
    std::string name;
    std::string data_type;
    bool is_nullable = true;
    std::optional<std::string> column_default;
    bool is_primary_key = false;
};

struct IndexInfo {
    std::string name;
    std::vector<std::string> columns;   // Index key order
    bool is_unique = false;
    bool is_primary = false;
};

struct ConstraintInfo {
    std::string name;
    std::string constraint_type;        // "PRIMARY KEY", "FOREIGN KEY", "UNIQUE", ...
    std::vector<std::string> columns;
    std::optional<std::string> foreign_table;
    std::optional<std::vector<std::string>> foreign_columns;
};

struct FunctionInfo {
    std::string name;
    std::string definition;
    std::optional<std::string> return_type;
    std::optional<std::string> language;
};

// ============================================================================
// Query Result
// ============================================================================

/**
 * @brief Uniform tabular result produced by every backend
 *
 * Invariant: every row has columns.size() cells, or columns and rows are
 * both empty and message is set.
 */
struct QueryResult {
    std::vector<std::string> columns;
    std::vector<std::vector<Value>> rows;
    size_t row_count = 0;
    std::optional<std::string> message;
    uint64_t execution_time_ms = 0;

    static QueryResult with_message(std::string msg) {
        QueryResult r;
        r.message = std::move(msg);
        return r;
    }
};

} // namespace polydb
