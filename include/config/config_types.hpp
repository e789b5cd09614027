#pragma once

#include "core/types.hpp"
#include "db/driver_factory.hpp"

#include <string>
#include <vector>

namespace polydb {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";   // debug | info | warn | error
};

/**
 * @brief Everything a polydb.toml file supplies
 *
 * drivers.pool.connection_string is always empty here; the driver
 * factory derives it from each descriptor.
 */
struct CoreConfig {
    LoggingConfig logging;
    DriverOptions drivers;
    std::vector<ConnectionDescriptor> connections;

    [[nodiscard]] const ConnectionDescriptor* find_connection(const std::string& id) const {
        for (const auto& c : connections) {
            if (c.id == id) return &c;
        }
        return nullptr;
    }
};

} // namespace polydb
