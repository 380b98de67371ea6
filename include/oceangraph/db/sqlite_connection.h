#ifndef OCEANGRAPH_DB_SQLITE_CONNECTION_H
#define OCEANGRAPH_DB_SQLITE_CONNECTION_H

#include <string>

struct sqlite3;      // Forward declaration for SQLite database handle

namespace oceangraph {
namespace db {

/*
 * Low-level RAII wrapper around a SQLite database connection.
 * Opening creates the `settings` table when it is missing. Failures are
 * reported as std::runtime_error carrying the SQLite message.
 */
class SQLiteConnection {
public:
    // ":memory:" opens a private in-memory database.
    explicit SQLiteConnection(const std::string& path);
    ~SQLiteConnection();

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Execute one or more SQL statements separated by semicolons.
    void exec(const std::string& sql);

    // Return the raw sqlite3* handle (use with care).
    sqlite3* getDbHandle();

private:
    sqlite3* db = nullptr;
};

} // namespace db
} // namespace oceangraph

#endif // OCEANGRAPH_DB_SQLITE_CONNECTION_H
