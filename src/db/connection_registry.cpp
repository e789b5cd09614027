#include "db/connection_registry.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <mutex>

namespace polydb {

ConnectionRegistry::ConnectionRegistry(DriverOptions options)
    : factory_([options = std::move(options)](const ConnectionDescriptor& descriptor) {
          return create_driver(descriptor, options);
      }) {}

ConnectionRegistry::ConnectionRegistry(DriverFactory factory)
    : factory_(std::move(factory)) {}

ConnectionRegistry::~ConnectionRegistry() {
    std::unordered_map<std::string, std::shared_ptr<IDbDriver>> drivers;
    {
        std::unique_lock lock(mutex_);
        drivers.swap(drivers_);
    }
    if (!drivers.empty()) {
        utils::log::info(std::format("Closing {} connection(s)", drivers.size()));
    }
}

Result<std::string> ConnectionRegistry::connect(const ConnectionDescriptor& descriptor) {
    // Handshake without holding the lock
    auto driver = factory_(descriptor);
    if (driver.is_error()) {
        return Result<std::string>::propagate(driver);
    }

    std::shared_ptr<IDbDriver> replaced;
    {
        std::unique_lock lock(mutex_);
        auto& slot = drivers_[descriptor.id];
        replaced = std::move(slot);
        slot = std::move(driver.value());
    }

    utils::log::info(std::format("Connected '{}' ({} {}:{}){}",
        descriptor.id, database_type_to_string(descriptor.type),
        descriptor.host, descriptor.port,
        replaced ? ", replacing the previous connection" : ""));

    // The previous driver closes here, outside the lock, once in-flight calls finish
    return Result<std::string>::ok(descriptor.id);
}

Status ConnectionRegistry::disconnect(const std::string& connection_id) {
    std::shared_ptr<IDbDriver> removed;
    {
        std::unique_lock lock(mutex_);
        const auto it = drivers_.find(connection_id);
        if (it == drivers_.end()) {
            return Status::error(ErrorCode::CONNECTION_NOT_FOUND,
                std::format("Connection '{}' not found", connection_id));
        }
        removed = std::move(it->second);
        drivers_.erase(it);
    }

    utils::log::info(std::format("Disconnected '{}'", connection_id));
    return Status::ok();
}

Status ConnectionRegistry::switch_database(const ConnectionDescriptor& descriptor,
                                           const std::string& database) {
    std::shared_ptr<IDbDriver> current;
    if (auto found = lookup(descriptor.id); found.is_ok()) {
        current = std::move(found.value());
    }

    if (current && current->type() != descriptor.type) {
        return Status::error(ErrorCode::INVALID_ARGUMENT,
            std::format("Connection '{}' is {}, not {}", descriptor.id,
                        database_type_to_string(current->type()),
                        database_type_to_string(descriptor.type)));
    }

    if (!is_relational(descriptor.type)) {
        if (!current) {
            return Status::error(ErrorCode::CONNECTION_NOT_FOUND,
                std::format("Connection '{}' not found or not connected", descriptor.id));
        }
        auto status = current->select_database(database);
        if (status.is_ok()) {
            utils::log::info(std::format("Switched '{}' to database {}", descriptor.id, database));
        }
        return status;
    }

    utils::log::warn(std::format(
        "Switching '{}' to database '{}' by reconnecting; the id is unregistered until the reconnect completes",
        descriptor.id, database));

    // Drop the snapshot so the old driver closes with its registry entry
    current.reset();
    if (auto removed = disconnect(descriptor.id); removed.is_error()) {
        utils::log::debug(removed.error_message());
    }

    ConnectionDescriptor updated = descriptor;
    updated.database = database;
    auto connected = connect(updated);
    if (connected.is_error()) {
        return Status::propagate(connected);
    }
    return Status::ok();
}

Result<std::shared_ptr<IDbDriver>> ConnectionRegistry::lookup(const std::string& connection_id) const {
    std::shared_lock lock(mutex_);
    const auto it = drivers_.find(connection_id);
    if (it == drivers_.end()) {
        return Result<std::shared_ptr<IDbDriver>>::error(ErrorCode::CONNECTION_NOT_FOUND,
            std::format("Connection '{}' not found or not connected", connection_id));
    }
    return Result<std::shared_ptr<IDbDriver>>::ok(it->second);
}

template<typename T, typename Fn>
Result<T> ConnectionRegistry::with_driver(const std::string& connection_id, Fn&& fn) {
    auto driver = lookup(connection_id);
    if (driver.is_error()) {
        return Result<T>::propagate(driver);
    }
    return fn(*driver.value());
}

Result<NameList> ConnectionRegistry::list_databases(const std::string& connection_id) {
    return with_driver<NameList>(connection_id, [](IDbDriver& d) {
        return d.list_databases();
    });
}

Result<NameList> ConnectionRegistry::list_schemas(const std::string& connection_id,
                                                  const std::string& database) {
    return with_driver<NameList>(connection_id, [&](IDbDriver& d) {
        return d.list_schemas(database);
    });
}

Result<NameList> ConnectionRegistry::list_tables(const std::string& connection_id,
                                                 const std::string& database,
                                                 const std::string& schema) {
    return with_driver<NameList>(connection_id, [&](IDbDriver& d) {
        return d.list_tables(database, schema);
    });
}

Result<NameList> ConnectionRegistry::list_views(const std::string& connection_id,
                                                const std::string& database,
                                                const std::string& schema) {
    return with_driver<NameList>(connection_id, [&](IDbDriver& d) {
        return d.list_views(database, schema);
    });
}

Result<NameList> ConnectionRegistry::list_functions(const std::string& connection_id,
                                                    const std::string& database,
                                                    const std::string& schema) {
    return with_driver<NameList>(connection_id, [&](IDbDriver& d) {
        return d.list_functions(database, schema);
    });
}

Result<FunctionInfo> ConnectionRegistry::get_function_definition(const std::string& connection_id,
                                                                 const std::string& database,
                                                                 const std::string& schema,
                                                                 const std::string& function_name) {
    return with_driver<FunctionInfo>(connection_id, [&](IDbDriver& d) {
        return d.get_function_definition(database, schema, function_name);
    });
}

Result<std::vector<ColumnInfo>> ConnectionRegistry::list_columns(const std::string& connection_id,
                                                                 const std::string& database,
                                                                 const std::string& schema,
                                                                 const std::string& table) {
    return with_driver<std::vector<ColumnInfo>>(connection_id, [&](IDbDriver& d) {
        return d.list_columns(database, schema, table);
    });
}

Result<std::vector<IndexInfo>> ConnectionRegistry::list_indexes(const std::string& connection_id,
                                                                const std::string& database,
                                                                const std::string& schema,
                                                                const std::string& table) {
    return with_driver<std::vector<IndexInfo>>(connection_id, [&](IDbDriver& d) {
        return d.list_indexes(database, schema, table);
    });
}

Result<std::vector<ConstraintInfo>> ConnectionRegistry::list_constraints(const std::string& connection_id,
                                                                         const std::string& database,
                                                                         const std::string& schema,
                                                                         const std::string& table) {
    return with_driver<std::vector<ConstraintInfo>>(connection_id, [&](IDbDriver& d) {
        return d.list_constraints(database, schema, table);
    });
}

Result<QueryResult> ConnectionRegistry::execute_query(const std::string& connection_id,
                                                      const std::string& statement,
                                                      const std::optional<std::string>& database) {
    return with_driver<QueryResult>(connection_id, [&](IDbDriver& d) {
        return d.execute_query(statement, database);
    });
}

std::vector<std::string> ConnectionRegistry::connection_ids() const {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(mutex_);
        ids.reserve(drivers_.size());
        for (const auto& [id, driver] : drivers_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t ConnectionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return drivers_.size();
}

} // namespace polydb
