#include "core/result_json.hpp"

#include <cmath>
#include <type_traits>

namespace polydb {

namespace {

template<typename T>
nlohmann::json optional_to_json(const std::optional<T>& opt) {
    return opt ? nlohmann::json(*opt) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json value_to_json(const Value& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, double>) {
            return std::isfinite(v) ? nlohmann::json(v) : nlohmann::json(nullptr);
        } else {
            return v;
        }
    }, value);
}

void to_json(nlohmann::json& j, const QueryResult& result) {
    auto rows = nlohmann::json::array();
    for (const auto& row : result.rows) {
        auto cells = nlohmann::json::array();
        for (const auto& cell : row) {
            cells.push_back(value_to_json(cell));
        }
        rows.push_back(std::move(cells));
    }

    j = nlohmann::json{
        {"columns", result.columns},
        {"rows", std::move(rows)},
        {"row_count", result.row_count},
        {"message", optional_to_json(result.message)},
        {"execution_time_ms", result.execution_time_ms},
    };
}

void to_json(nlohmann::json& j, const ColumnInfo& column) {
    j = nlohmann::json{
        {"name", column.name},
        {"data_type", column.data_type},
        {"is_nullable", column.is_nullable},
        {"column_default", optional_to_json(column.column_default)},
        {"is_primary_key", column.is_primary_key},
    };
}

void to_json(nlohmann::json& j, const IndexInfo& index) {
    j = nlohmann::json{
        {"name", index.name},
        {"columns", index.columns},
        {"is_unique", index.is_unique},
        {"is_primary", index.is_primary},
    };
}

void to_json(nlohmann::json& j, const ConstraintInfo& constraint) {
    j = nlohmann::json{
        {"name", constraint.name},
        {"constraint_type", constraint.constraint_type},
        {"columns", constraint.columns},
        {"foreign_table", optional_to_json(constraint.foreign_table)},
        {"foreign_columns", optional_to_json(constraint.foreign_columns)},
    };
}

void to_json(nlohmann::json& j, const FunctionInfo& function) {
    j = nlohmann::json{
        {"name", function.name},
        {"definition", function.definition},
        {"return_type", optional_to_json(function.return_type)},
        {"language", optional_to_json(function.language)},
    };
}

std::string dump_json(const nlohmann::json& j, const int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace polydb
