#include "config/config_loader.hpp"
#include "config/connection_url.hpp"
#include "core/result_json.hpp"
#include "core/utils.hpp"
#include "db/connection_registry.hpp"

#include <format>
#include <optional>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace polydb;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

constexpr const char* kUsage =
    "usage: polydb (-c <config> -i <connection-id> | -u <url>) <command> [args...]\n"
    "\n"
    "commands:\n"
    "  databases\n"
    "  schemas     <database>\n"
    "  tables      <database> <schema>\n"
    "  views       <database> <schema>\n"
    "  functions   <database> <schema>\n"
    "  function    <database> <schema> <name>\n"
    "  columns     <database> <schema> <table>\n"
    "  indexes     <database> <schema> <table>\n"
    "  constraints <database> <schema> <table>\n"
    "  query       <statement> [database]\n"
    "  switch      <database>\n"
    "\n"
    "options:\n"
    "  -c <file>   TOML config with [[connections]]\n"
    "  -i <id>     connection id from the config\n"
    "  -u <url>    ad-hoc connection URL (postgres, mysql, sqlite, redis)\n"
    "  -p          pretty-print JSON\n";

struct CliOptions {
    std::string config_file;
    std::string connection_id;
    std::string url;
    bool pretty = false;
    std::string command;
    std::vector<std::string> args;
};

struct CommandOutcome {
    bool success = false;
    std::string error;
    nlohmann::json output;
};

template<typename T>
CommandOutcome to_outcome(Result<T> result) {
    if (result.is_error()) {
        return {false, result.error_message(), nullptr};
    }
    return {true, {}, nlohmann::json(result.value())};
}

CommandOutcome to_outcome(const Status& status, nlohmann::json on_success) {
    if (status.is_error()) {
        return {false, status.error_message(), nullptr};
    }
    return {true, {}, std::move(on_success)};
}

using Handler = std::function<CommandOutcome(ConnectionRegistry&, const ConnectionDescriptor&,
                                             const std::vector<std::string>&)>;

struct CommandEntry {
    size_t min_args;
    size_t max_args;
    Handler handler;
};

const std::unordered_map<std::string, CommandEntry>& command_table() {
    static const std::unordered_map<std::string, CommandEntry> table = {
        {"databases", {0, 0, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto&) {
            return to_outcome(r.list_databases(d.id));
        }}},
        {"schemas", {1, 1, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto& a) {
            return to_outcome(r.list_schemas(d.id, a[0]));
        }}},
        {"tables", {2, 2, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto& a) {
            return to_outcome(r.list_tables(d.id, a[0], a[1]));
        }}},
        {"views", {2, 2, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto& a) {
            return to_outcome(r.list_views(d.id, a[0], a[1]));
        }}},
        {"functions", {2, 2, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto& a) {
            return to_outcome(r.list_functions(d.id, a[0], a[1]));
        }}},
        {"function", {3, 3, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto& a) {
            return to_outcome(r.get_function_definition(d.id, a[0], a[1], a[2]));
        }}},
        {"columns", {3, 3, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto& a) {
            return to_outcome(r.list_columns(d.id, a[0], a[1], a[2]));
        }}},
        {"indexes", {3, 3, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto& a) {
            return to_outcome(r.list_indexes(d.id, a[0], a[1], a[2]));
        }}},
        {"constraints", {3, 3, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto& a) {
            return to_outcome(r.list_constraints(d.id, a[0], a[1], a[2]));
        }}},
        {"query", {1, 2, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto& a) {
            const std::optional<std::string> database =
                a.size() > 1 ? std::make_optional(a[1]) : std::nullopt;
            return to_outcome(r.execute_query(d.id, a[0], database));
        }}},
        {"switch", {1, 1, [](ConnectionRegistry& r, const ConnectionDescriptor& d, const auto& a) {
            return to_outcome(r.switch_database(d, a[0]),
                              nlohmann::json{{"connection_id", d.id}, {"database", a[0]}});
        }}},
    };
    return table;
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    int i = 1;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        }
        if (arg == "-p") {
            opts.pretty = true;
            continue;
        }
        if (arg == "-c" || arg == "-i" || arg == "-u") {
            if (i + 1 >= argc) {
                std::cerr << std::format("polydb: option {} needs a value\n", arg);
                return std::nullopt;
            }
            std::string& target = arg == "-c" ? opts.config_file
                                : arg == "-i" ? opts.connection_id
                                : opts.url;
            target = argv[++i];
            continue;
        }
        break;
    }

    if (i >= argc) {
        std::cerr << "polydb: missing command\n";
        return std::nullopt;
    }
    opts.command = argv[i++];
    for (; i < argc; ++i) {
        opts.args.emplace_back(argv[i]);
    }

    const bool from_config = !opts.config_file.empty() && !opts.connection_id.empty();
    if (from_config == !opts.url.empty()) {
        std::cerr << "polydb: give either -c and -i, or -u\n";
        return std::nullopt;
    }
    return opts;
}

} // namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        std::cerr << kUsage;
        return kExitUsage;
    }

    const auto& commands = command_table();
    const auto entry = commands.find(opts->command);
    if (entry == commands.end()) {
        std::cerr << std::format("polydb: unknown command '{}'\n", opts->command) << kUsage;
        return kExitUsage;
    }
    if (opts->args.size() < entry->second.min_args || opts->args.size() > entry->second.max_args) {
        std::cerr << std::format("polydb: wrong number of arguments for '{}'\n", opts->command) << kUsage;
        return kExitUsage;
    }

    try {
        DriverOptions driver_options;
        ConnectionDescriptor descriptor;

        if (!opts->url.empty()) {
            auto parsed = parse_connection_url(opts->url);
            if (parsed.is_error()) {
                std::cerr << parsed.error_message() << '\n';
                return kExitUsage;
            }
            descriptor = std::move(parsed.value());
            descriptor.id = "cli";
            descriptor.name = "cli";
        } else {
            auto loaded = ConfigLoader::load_from_file(opts->config_file);
            if (!loaded.success) {
                std::cerr << loaded.error_message << '\n';
                return kExitFailure;
            }
            if (!utils::log::set_level(loaded.config.logging.level)) {
                utils::log::warn(std::format("Unknown log level '{}'", loaded.config.logging.level));
            }

            const auto* found = loaded.config.find_connection(opts->connection_id);
            if (!found) {
                std::cerr << std::format("Connection '{}' not found in {}\n",
                                         opts->connection_id, opts->config_file);
                return kExitFailure;
            }
            descriptor = *found;
            driver_options = loaded.config.drivers;
        }

        ConnectionRegistry registry(driver_options);
        auto connected = registry.connect(descriptor);
        if (connected.is_error()) {
            std::cerr << connected.error_message() << '\n';
            return kExitFailure;
        }

        const auto outcome = entry->second.handler(registry, descriptor, opts->args);
        if (auto status = registry.disconnect(descriptor.id); status.is_error()) {
            utils::log::debug(status.error_message());
        }

        if (!outcome.success) {
            std::cerr << outcome.error << '\n';
            return kExitFailure;
        }
        std::cout << dump_json(outcome.output, opts->pretty ? 2 : -1) << '\n';

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }

    return kExitOk;
}
