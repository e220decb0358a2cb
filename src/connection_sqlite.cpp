#include "sqlconnection.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <lib.hpp>

class SQLiteStatement final : public SQLStatement {
public:
    SQLiteStatement(sqlite3_stmt* stmt, std::string sql)
        : stmt_(stmt), sql_(std::move(sql)) { }
    ~SQLiteStatement() override {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    void bind(int idx, const jval& value) override {
        if (idx < 1 || idx > sqlite3_bind_parameter_count(stmt_))
            THROW("bind: index %d out of range for: %s", idx, sql_.c_str());
        // integers keep their native type, the rest goes as text
        if (value.IsInt64()) { check(sqlite3_bind_int64(stmt_, idx, value.GetInt64())); return; }
        if (value.IsDouble()) { check(sqlite3_bind_double(stmt_, idx, value.GetDouble())); return; }
        bind_text(idx, value);
    }

    int exec() override {
        step_all(nullptr);
        return sqlite3_changes(sqlite3_db_handle(stmt_));
    }

    jdoc fetch() override {
        jdoc rows(rapidjson::kArrayType);
        step_all(&rows);
        return rows;
    }

protected:
    void set_text(int idx, std::string value) override {
        // handle unicode string UTF-8
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void set_null(int idx) override {
        check(sqlite3_bind_null(stmt_, idx));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK)
            THROW("SQLite bind failed: %s", sqlite3_errmsg(sqlite3_db_handle(stmt_)));
    }

    void step_all(jdoc* rows) {
        int rc;
        while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
            if (!rows) continue;
            auto& a = rows->GetAllocator();
            jval row(rapidjson::kObjectType);
            int cols = sqlite3_column_count(stmt_);
            for (int c = 0; c < cols; ++c) {
                const char* name = sqlite3_column_name(stmt_, c);
                jval v;
                if (sqlite3_column_type(stmt_, c) != SQLITE_NULL) {
                    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, c));
                    v = jhlp::str_val(text ? text : "", a);
                }
                row.AddMember(jhlp::str_val(name ? name : "", a), v, a);
            }
            rows->PushBack(row, a);
        }
        if (rc != SQLITE_DONE) {
            THROW("SQLite exec failed: %s [%s]", sqlite3_errmsg(sqlite3_db_handle(stmt_)), sql_.c_str());
        }
    }

    sqlite3_stmt* stmt_;
    std::string sql_;
};

class SQLiteConnection final : public SQLConnection {
public:
    ~SQLiteConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        if (sqlite3_open(dsn.c_str(), &db_) != SQLITE_OK) {
            std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
            disconnect();
            THROW("Failed to open SQLite DB %s: %s", dsn.c_str(), err.c_str());
        }
        // pooled connections share the file: wait for the writer instead of failing
        sqlite3_busy_timeout(db_, 10000);
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        tr_started_ = false;
    }

    // transaction control
    bool begin() override {
        if (tr_started_) return true;
        // take the write lock up front: two deferred writers would deadlock
        tr_started_ = execSQL("BEGIN IMMEDIATE;");
        return tr_started_;
    }

    bool commit() override {
        if (!tr_started_) return false;
        if (execSQL("COMMIT;")) {
            tr_started_ = false;
            return true;
        }
        return false;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        // some errors already rolled the transaction back
        if (db_ && !sqlite3_get_autocommit(db_)) execSQL("ROLLBACK;");
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!db_) THROW("prepare: not connected");
        sqlite3_stmt* stmt = nullptr;
        // (the number of chars where 1 char = 1 byte) + 1 null_terminator
        if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size() + 1), &stmt, nullptr) != SQLITE_OK) {
            THROW("SQLite prepare failed: %s [%s]", sqlite3_errmsg(db_), sql.c_str());
        }
        return std::make_unique<SQLiteStatement>(stmt, sql);
    }

    std::string driver() const override { return "sqlite"; }

private:
    bool execSQL(const char* sql) {
        if (!db_) THROW("execSQL: not connected");
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string err = errmsg ? errmsg : "unknown";
            sqlite3_free(errmsg);
            THROW("SQLite error: %s", err.c_str());
        }
        return true;
    }

    sqlite3* db_ = nullptr;
};

PSQLConnection make_sqlite_connection() {
    return std::make_unique<SQLiteConnection>();
}
