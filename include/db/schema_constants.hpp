#pragma once

#include <string_view>

namespace polydb::db {

// information_schema flags
inline constexpr std::string_view kYes = "YES";
inline constexpr std::string_view kPri = "PRI";

// Placeholder name for backends without a database/schema level
inline constexpr std::string_view kMain = "main";

// Constraint type labels
inline constexpr std::string_view kPrimaryKey = "PRIMARY KEY";
inline constexpr std::string_view kForeignKey = "FOREIGN KEY";

// Result messages
inline constexpr std::string_view kEmptyQuery   = "Empty query";
inline constexpr std::string_view kEmptyCommand = "Empty command";
inline constexpr std::string_view kNoRows       = "0 row(s) affected.";

} // namespace polydb::db
