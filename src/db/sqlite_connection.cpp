#include <oceangraph/db/sqlite_connection.h>
#include <sqlite3.h>
#include <stdexcept>

namespace oceangraph {
namespace db {

SQLiteConnection::SQLiteConnection(const std::string& path) : db(nullptr) {
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string err_msg = "Database connection failed: ";
        if (db) {
            err_msg += sqlite3_errmsg(db);
            sqlite3_close(db);
            db = nullptr;
        } else {
            err_msg += "Could not allocate memory for database handle.";
        }
        throw std::runtime_error(err_msg);
    }

    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY NOT NULL,
            value TEXT
        );
    )";
    try {
        exec(schema);
    } catch (...) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

SQLiteConnection::~SQLiteConnection() {
    if (db) {
        sqlite3_close(db);
    }
}

void SQLiteConnection::exec(const std::string& sql) {
    char* err_msg_ptr = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg_ptr) != SQLITE_OK) {
        std::string error_message_str = "SQL error executing '";
        error_message_str += sql;
        error_message_str += "': ";
        if (err_msg_ptr) {
            error_message_str += err_msg_ptr;
            sqlite3_free(err_msg_ptr);
        } else {
            error_message_str += "Unknown SQLite error (no specific message provided by sqlite3_exec)";
        }
        throw std::runtime_error(error_message_str);
    }
}

sqlite3* SQLiteConnection::getDbHandle() {
    return db;
}

} // namespace db
} // namespace oceangraph
