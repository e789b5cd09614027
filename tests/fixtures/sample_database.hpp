#pragma once

#include "fixtures/temp_path.hpp"
#include <catch2/catch_test_macros.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <string>

namespace polydb::testing {

/**
 * @brief Temporary SQLite file seeded with a small schema
 *
 * The file is created through the sqlite3 API; the driver itself never
 * creates files.
 */
class SampleDatabase {
public:
    SampleDatabase()
        : path_(unique_temp_path("polydb_test_sample", ".db")) {
        sqlite3* db = nullptr;
        REQUIRE(sqlite3_open_v2(path_.c_str(), &db,
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) == SQLITE_OK);

        const char* schema =
            "CREATE TABLE users ("
            "  id INTEGER PRIMARY KEY,"
            "  email TEXT UNIQUE,"
            "  name TEXT NOT NULL DEFAULT 'anon',"
            "  active BOOLEAN,"
            "  score REAL);"
            "CREATE INDEX idx_users_name ON users(name);"
            "CREATE TABLE orders ("
            "  id INTEGER PRIMARY KEY,"
            "  user_id INTEGER REFERENCES users(id),"
            "  total REAL);"
            "CREATE VIEW active_users AS SELECT id, email FROM users WHERE active = 1;"
            "INSERT INTO users (email, name, active, score) VALUES"
            "  ('a@example.com', 'alice', 1, 9.5),"
            "  ('b@example.com', 'bob', 0, NULL);";

        char* err = nullptr;
        const int rc = sqlite3_exec(db, schema, nullptr, nullptr, &err);
        if (err) {
            sqlite3_free(err);
        }
        sqlite3_close(db);
        REQUIRE(rc == SQLITE_OK);
    }

    ~SampleDatabase() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    SampleDatabase(const SampleDatabase&) = delete;
    SampleDatabase& operator=(const SampleDatabase&) = delete;

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace polydb::testing
