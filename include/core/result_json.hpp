#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace polydb {

// ============================================================================
// JSON wire format for results handed to the presentation layer
// ============================================================================

/**
 * @brief Portable value as JSON: null, boolean, integer, number or string
 *
 * Non-finite doubles have no JSON form and serialize as null.
 */
[[nodiscard]] nlohmann::json value_to_json(const Value& value);

// ADL hooks, so `nlohmann::json j = result;` works for every result type.
// Absent optionals serialize as null.
void to_json(nlohmann::json& j, const QueryResult& result);
void to_json(nlohmann::json& j, const ColumnInfo& column);
void to_json(nlohmann::json& j, const IndexInfo& index);
void to_json(nlohmann::json& j, const ConstraintInfo& constraint);
void to_json(nlohmann::json& j, const FunctionInfo& function);

/**
 * @brief Compact text; invalid UTF-8 in strings is replaced with U+FFFD
 */
[[nodiscard]] std::string dump_json(const nlohmann::json& j, int indent = -1);

} // namespace polydb
