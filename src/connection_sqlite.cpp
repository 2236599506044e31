#include "rowmap/sqlconnection.hpp"
#include <sqlite3.h>
#include <string>

namespace rowmap {

namespace {

    // Map an engine failure onto the error taxonomy.
    [[noreturn]] void throw_sqlite(sqlite3* db, int rc, const char* what, const std::string& sql) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if ((rc & 0xff) == SQLITE_CONSTRAINT)
            ROWMAP_THROW(ConstraintViolation, "SQLite %s: %s [%s]", what, msg.c_str(), sql.c_str());
        ROWMAP_THROW(StorageError, "SQLite %s: %s [%s]", what, msg.c_str(), sql.c_str());
    }

} // namespace

class SQLiteStatement final : public SQLStatement {
public:
    SQLiteStatement(sqlite3* db, sqlite3_stmt* stmt, std::string sql)
        : db_(db), stmt_(stmt), sql_(std::move(sql)) { }
    ~SQLiteStatement() override {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    bool step() override {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw_sqlite(db_, sqlite3_extended_errcode(db_), "step failed", sql_);
    }

    int exec() override {
        while (step()) { }
        return sqlite3_changes(db_);
    }

    int column_count() const override {
        return sqlite3_column_count(stmt_);
    }

    std::string column_name(int col) const override {
        const char* name = sqlite3_column_name(stmt_, col);
        return name ? name : "";
    }

    jval column_value(int col, jalloc& a) const override {
        switch (sqlite3_column_type(stmt_, col)) {
            case SQLITE_INTEGER:
                return jval(static_cast<int64_t>(sqlite3_column_int64(stmt_, col)));
            case SQLITE_FLOAT:
                return jval(sqlite3_column_double(stmt_, col));
            case SQLITE_TEXT: {
                const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
                int len = sqlite3_column_bytes(stmt_, col);
                return jval(text, static_cast<json::SizeType>(len), a);
            }
            case SQLITE_BLOB: {
                const char* data = static_cast<const char*>(sqlite3_column_blob(stmt_, col));
                int len = sqlite3_column_bytes(stmt_, col);
                if (!data) return jval("", 0, a);
                return jval(data, static_cast<json::SizeType>(len), a);
            }
            default:
                return jval(json::kNullType);
        }
    }

protected:
    void set_null(int idx) override {
        check_(sqlite3_bind_null(stmt_, idx));
    }

    void set_int(int idx, int64_t value) override {
        check_(sqlite3_bind_int64(stmt_, idx, value));
    }

    void set_real(int idx, double value) override {
        check_(sqlite3_bind_double(stmt_, idx, value));
    }

    void set_text(int idx, const std::string& value) override {
        //handle unicode string UTF-8
        check_(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void set_blob(int idx, const std::string& data) override {
        check_(sqlite3_bind_blob(stmt_, idx, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT));
    }

private:
    void check_(int rc) {
        // a bind failure means the caller's parameter count does not match the text
        if (rc != SQLITE_OK) {
            std::string msg = sqlite3_errstr(rc);
            ROWMAP_THROW(QueryError, "SQLite bind failed: %s [%s]", msg.c_str(), sql_.c_str());
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
    std::string sql_;
};

class SQLiteConnection final : public SQLConnection {
public:
    ~SQLiteConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        int rc = sqlite3_open(dsn.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string err = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            ROWMAP_THROW(StorageError, "Failed to open SQLite DB '%s': %s", dsn.c_str(), err.c_str());
        }
        sqlite3_extended_result_codes(db_, 1);
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        tr_started_ = false;
    }

    bool is_open() const override { return db_ != nullptr; }

    // transaction control
    bool begin() override {
        if (tr_started_) return true;
        tr_started_ = execSQL("BEGIN;");
        return tr_started_;
    }

    bool commit() override {
        if (!tr_started_) return false;
        execSQL("COMMIT;");
        tr_started_ = false;
        return true;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        // a failed statement may already have ended the transaction
        if (!sqlite3_get_autocommit(db_)) execSQL("ROLLBACK;");
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!db_) ROWMAP_THROW(StorageError, "SQLite prepare on a closed connection [%s]", sql.c_str());
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()) + 1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            std::string err = sqlite3_errmsg(db_);
            if (stmt) sqlite3_finalize(stmt);
            ROWMAP_THROW(QueryError, "SQLite prepare failed: %s [%s]", err.c_str(), sql.c_str());
        }
        return std::make_unique<SQLiteStatement>(db_, stmt, sql);
    }

    int64_t last_insert_id() override {
        return db_ ? sqlite3_last_insert_rowid(db_) : 0;
    }

private:
    bool execSQL(const char* sql) {
        if (!db_) ROWMAP_THROW(StorageError, "SQLite exec on a closed connection [%s]", sql);
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string err = errmsg ? errmsg : sqlite3_errstr(rc);
            sqlite3_free(errmsg);
            if ((rc & 0xff) == SQLITE_CONSTRAINT)
                ROWMAP_THROW(ConstraintViolation, "SQLite error: %s [%s]", err.c_str(), sql);
            ROWMAP_THROW(StorageError, "SQLite error: %s [%s]", err.c_str(), sql);
        }
        return true;
    }

    sqlite3* db_ = nullptr;
};

PSQLConnection make_sqlite_connection() {
    return std::make_unique<SQLiteConnection>();
}

} // namespace rowmap
