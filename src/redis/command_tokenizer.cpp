#include "redis/command_tokenizer.hpp"
#include "core/utils.hpp"
#include <cctype>

namespace polydb::redis {

std::vector<std::string> CommandTokenizer::tokenize(std::string_view input) {
    std::vector<std::string> parts;
    std::string current;
    bool in_quotes = false;
    char quote_char = '\0';

    for (size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];

        if (in_quotes) {
            if (c == quote_char) {
                in_quotes = false;
            } else if (c == '\\') {
                if (i + 1 < input.size()) {
                    const char next = input[++i];
                    switch (next) {
                        case 'n': current += '\n'; break;
                        case 't': current += '\t'; break;
                        case 'r': current += '\r'; break;
                        default:  current += next; break;
                    }
                }
            } else {
                current += c;
            }
        } else if (c == '"' || c == '\'') {
            in_quotes = true;
            quote_char = c;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

std::string CommandTokenizer::strip_terminator(std::string_view input) {
    std::string trimmed = utils::trim(input);
    const auto last = trimmed.find_last_not_of(';');
    if (last == std::string::npos) {
        return "";
    }
    trimmed.erase(last + 1);
    return utils::trim(trimmed);
}

} // namespace polydb::redis
