#include "config/connection_url.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace polydb {

namespace {

using UrlResult = Result<ConnectionDescriptor>;

constexpr std::string_view kSchemeSeparator = "://";

UrlResult invalid(std::string_view reason) {
    return UrlResult::error(ErrorCode::PARSE_ERROR, std::format("Invalid URL: {}", reason));
}

bool valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    for (const char c : scheme) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

std::optional<DatabaseType> scheme_type(std::string_view scheme) {
    if (scheme == "postgres" || scheme == "postgresql") return DatabaseType::POSTGRESQL;
    if (scheme == "mysql" || scheme == "mariadb") return DatabaseType::MYSQL;
    if (scheme == "sqlite") return DatabaseType::SQLITE;
    if (scheme == "redis") return DatabaseType::REDIS;
    return std::nullopt;
}

// Query string and fragment never reach the descriptor
std::string_view strip_query(std::string_view sv) {
    const size_t end = sv.find_first_of("?#");
    return end == std::string_view::npos ? sv : sv.substr(0, end);
}

} // namespace

uint16_t default_port(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return 5432;
        case DatabaseType::MYSQL: return 3306;
        case DatabaseType::SQLITE: return 0;
        case DatabaseType::REDIS: return 6379;
    }
    return 0;
}

Result<ConnectionDescriptor> parse_connection_url(std::string_view url) {
    const std::string trimmed = utils::trim(url);
    std::string_view sv = trimmed;
    if (sv.empty()) {
        return invalid("empty input");
    }

    const size_t sep = sv.find(kSchemeSeparator);
    if (sep == std::string_view::npos) {
        return invalid("relative URL without a base");
    }
    const std::string_view raw_scheme = sv.substr(0, sep);
    if (!valid_scheme(raw_scheme)) {
        return invalid(std::format("bad scheme '{}'", raw_scheme));
    }

    const std::string scheme = utils::to_lower(raw_scheme);
    const auto type = scheme_type(scheme);
    if (!type) {
        return UrlResult::error(ErrorCode::PARSE_ERROR, std::format(
            "Unsupported database scheme: {}. Expected postgres, postgresql, mysql, mariadb, sqlite, or redis",
            scheme));
    }
    sv.remove_prefix(sep + kSchemeSeparator.size());
    sv = strip_query(sv);

    // Authority runs up to the first '/'
    const size_t slash_pos = sv.find('/');
    const std::string_view authority = sv.substr(0, slash_pos);
    const std::string_view path = slash_pos == std::string_view::npos
        ? std::string_view{}
        : sv.substr(slash_pos);

    ConnectionDescriptor descriptor;
    descriptor.type = *type;

    if (*type == DatabaseType::SQLITE) {
        descriptor.database = std::string(path);
        return UrlResult::ok(std::move(descriptor));
    }

    // Split user:password@host:port
    std::string_view host_port = authority;
    std::string_view user;
    std::string_view password;
    if (const size_t at_pos = authority.rfind('@'); at_pos != std::string_view::npos) {
        const std::string_view creds = authority.substr(0, at_pos);
        host_port = authority.substr(at_pos + 1);
        if (const size_t colon_pos = creds.find(':'); colon_pos != std::string_view::npos) {
            user = creds.substr(0, colon_pos);
            password = creds.substr(colon_pos + 1);
        } else {
            user = creds;
        }
    }

    std::string_view host = host_port;
    std::string_view port_str;
    if (host_port.starts_with('[')) {
        // IPv6 literal keeps its brackets out of the host
        const size_t close = host_port.find(']');
        if (close == std::string_view::npos) {
            return invalid("invalid IPv6 address");
        }
        host = host_port.substr(1, close - 1);
        const std::string_view rest = host_port.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return invalid("invalid IPv6 address");
            port_str = rest.substr(1);
        }
    } else if (const size_t colon_pos = host_port.rfind(':'); colon_pos != std::string_view::npos) {
        host = host_port.substr(0, colon_pos);
        port_str = host_port.substr(colon_pos + 1);
    }

    if (host.empty()) {
        return UrlResult::error(ErrorCode::PARSE_ERROR, "Missing host in connection URL");
    }

    descriptor.port = default_port(*type);
    if (!port_str.empty()) {
        const auto port = utils::try_parse_int<uint16_t>(port_str);
        if (!port) {
            return invalid("invalid port number");
        }
        descriptor.port = *port;
    }

    if (user.empty() && *type != DatabaseType::REDIS) {
        return UrlResult::error(ErrorCode::PARSE_ERROR, "Missing username in connection URL");
    }

    descriptor.host = utils::to_lower(host);
    descriptor.username = utils::percent_decode(user);
    descriptor.password = utils::percent_decode(password);
    if (path.size() > 1) {
        descriptor.database = std::string(path.substr(1));
    }
    return UrlResult::ok(std::move(descriptor));
}

} // namespace polydb
