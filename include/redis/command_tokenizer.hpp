#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace polydb::redis {

/**
 * @brief Shell-style splitting of one Redis command line
 *
 * Whitespace separates arguments. Single or double quotes group text,
 * and inside quotes a backslash escapes the next character (\n, \t and
 * \r are translated, anything else is taken literally). An unterminated
 * quote runs to the end of the input rather than failing.
 */
class CommandTokenizer {
public:
    [[nodiscard]] static std::vector<std::string> tokenize(std::string_view input);

    /**
     * @brief Trim whitespace and trailing ';' terminators
     */
    [[nodiscard]] static std::string strip_terminator(std::string_view input);
};

} // namespace polydb::redis
