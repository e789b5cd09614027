#pragma once

#include "core/utils.hpp"
#include <array>
#include <string_view>

namespace polydb {

/**
 * @brief Coarse read/write classification of a SQL statement
 *
 * A statement is write-only (reports an affected-row count instead of a
 * result set) when its first keyword is a write keyword and the text
 * does not contain RETURNING anywhere.
 */
class StatementClassifier {
public:
    [[nodiscard]] static bool is_write_only(std::string_view sql) {
        const std::string upper = utils::to_upper(utils::trim(sql));

        if (upper.find("RETURNING") != std::string::npos) {
            return false;
        }

        const auto end = upper.find_first_of(" \t\n\r\f\v");
        const std::string_view first_word = std::string_view(upper).substr(0, end);

        for (const auto keyword : kWriteKeywords) {
            if (first_word == keyword) {
                return true;
            }
        }
        return false;
    }

private:
    static constexpr std::array<std::string_view, 9> kWriteKeywords = {
        "INSERT", "UPDATE", "DELETE", "CREATE", "ALTER",
        "DROP", "TRUNCATE", "GRANT", "REVOKE",
    };
};

} // namespace polydb
