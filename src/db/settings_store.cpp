#include <oceangraph/db/settings_store.h>
#include <oceangraph/db/sqlite_connection.h>
#include <sqlite3.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace oceangraph {
namespace db {
namespace {
struct SQLiteStmtDeleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};
using unique_sqlite_stmt_ptr = std::unique_ptr<sqlite3_stmt, SQLiteStmtDeleter>;

[[noreturn]] void ThrowSqliteError(sqlite3* db, const std::string& what) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
}

unique_sqlite_stmt_ptr Prepare(sqlite3* db, const char* sql, const char* operation) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    unique_sqlite_stmt_ptr guard(stmt);
    if (rc != SQLITE_OK) {
        ThrowSqliteError(db, std::string("Failed to prepare ") + operation + " statement");
    }
    return guard;
}

void BindText(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& text, const char* operation) {
    if (sqlite3_bind_text(stmt, index, text.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        ThrowSqliteError(db, std::string("Failed to bind parameter ") + std::to_string(index) + " in " + operation);
    }
}
} // end anonymous namespace

SettingsStore::SettingsStore(SQLiteConnection& db_conn) : m_db_conn(db_conn) {}

void SettingsStore::saveSetting(const std::string& key, const std::string& value) {
    sqlite3* db = m_db_conn.getDbHandle();
    auto stmt = Prepare(db, "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?)", "saveSetting");
    BindText(db, stmt.get(), 1, key, "saveSetting");
    BindText(db, stmt.get(), 2, value, "saveSetting");
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        ThrowSqliteError(db, "saveSetting failed for key '" + key + "'");
    }
}

std::optional<std::string> SettingsStore::loadSetting(const std::string& key) {
    sqlite3* db = m_db_conn.getDbHandle();
    auto stmt = Prepare(db, "SELECT value FROM settings WHERE key = ?", "loadSetting");
    BindText(db, stmt.get(), 1, key, "loadSetting");

    int step_result = sqlite3_step(stmt.get());
    if (step_result == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        if (!text) return std::nullopt;
        return std::string(reinterpret_cast<const char*>(text));
    }
    if (step_result != SQLITE_DONE) {
        ThrowSqliteError(db, "loadSetting failed for key '" + key + "'");
    }
    return std::nullopt;
}

} // namespace db
} // namespace oceangraph
