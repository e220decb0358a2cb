#pragma once
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "jsonhlp.hpp"

using SQLParams = std::vector<std::string>;

class SQLStatement {
public:
    virtual ~SQLStatement() = default;

    // 1-based positional parameter, text format; Null -> SQL NULL,
    // numbers and booleans are sent in their text form
    virtual void bind(int idx, const jval& value) = 0;

    virtual int exec() = 0;   // return rows affected
    virtual jdoc fetch() = 0; // array of row objects, column -> string|null

protected:
    virtual void set_null(int idx) = 0;
    virtual void set_text(int idx, std::string value) = 0;

    void set_bool(int idx, bool value) {
        set_text(idx, value ? "true" : "false");
    }

    // shared part of bind() for the text protocol drivers
    void bind_text(int idx, const jval& value) {
        if (value.IsNull()) { set_null(idx); return; }
        if (value.IsString()) { set_text(idx, value.GetString()); return; }
        if (value.IsBool()) { set_bool(idx, value.GetBool()); return; }
        if (value.IsInt64()) { set_text(idx, std::to_string(value.GetInt64())); return; }
        if (value.IsUint64()) { set_text(idx, std::to_string(value.GetUint64())); return; }
        if (value.IsNumber()) { set_text(idx, jhlp::stringify(value)); return; }
        set_text(idx, jhlp::stringify(value)); // objects/arrays as JSON text
    }
};

/**
 * SQLConnection
 *  - one driver connection (PostgreSQL or SQLite)
 *  - execute / fetch / fetchval run one statement with text parameters
 *  - begin / commit / rollback drive one transaction at a time
 */
class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    // Connect using a DSN / path (SQLite: filename; Postgres: conninfo).
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect() = 0;

    virtual std::unique_ptr<SQLStatement> prepare(const std::string& sql) = 0;

    virtual bool begin() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;

    // "postgres" | "sqlite" | "fake"
    virtual std::string driver() const = 0;

    bool in_transaction() const { return tr_started_; }

    // Run one statement, returns rows affected.
    int execute(const std::string& sql, const SQLParams& params = {}) {
        auto stmt = prepare(sql);
        bind_all(*stmt, params);
        return stmt->exec();
    }

    // Rows as an array of objects.
    jdoc fetch(const std::string& sql, const SQLParams& params = {}) {
        auto stmt = prepare(sql);
        bind_all(*stmt, params);
        return stmt->fetch();
    }

    // First column of the first row, nullopt when there is no row or it is NULL.
    std::optional<std::string> fetchval(const std::string& sql, const SQLParams& params = {}) {
        jdoc rows = fetch(sql, params);
        if (!rows.IsArray() || rows.Empty()) return std::nullopt;
        const jval& row = *rows.Begin();
        if (!row.IsObject() || row.MemberCount() == 0) return std::nullopt;
        const jval& v = row.MemberBegin()->value;
        if (v.IsNull()) return std::nullopt;
        return jhlp::val2str(v);
    }

protected:
    bool tr_started_ = false;

private:
    static void bind_all(SQLStatement& stmt, const SQLParams& params) {
        for (size_t i = 0; i < params.size(); ++i) {
            jval v(rapidjson::StringRef(params[i].c_str(), static_cast<rapidjson::SizeType>(params[i].size())));
            stmt.bind(static_cast<int>(i + 1), v);
        }
    }
};

// Helpers for ownership
using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_postgres_connection();
PSQLConnection make_sqlite_connection();

// "postgres" | "sqlite"
inline PSQLConnection make_connection(const std::string& driver) {
    if (driver == "postgres") return make_postgres_connection();
    if (driver == "sqlite") return make_sqlite_connection();
    THROW("Unknown SQL driver: %s", driver.c_str());
}

/**
 * Transaction
 *  - begin on construction, rollback on destruction unless commit() ran
 *  - the handle given to migration hooks: statements run inside the unit
 */
class Transaction {
public:
    explicit Transaction(SQLConnection& conn) : conn_(conn) {
        if (!conn_.begin()) THROW("begin() failed");
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    ~Transaction() {
        if (open_) rollback();
    }

    int execute(const std::string& sql, const SQLParams& params = {}) { return conn_.execute(sql, params); }
    jdoc fetch(const std::string& sql, const SQLParams& params = {}) { return conn_.fetch(sql, params); }
    std::optional<std::string> fetchval(const std::string& sql, const SQLParams& params = {}) {
        return conn_.fetchval(sql, params);
    }

    void commit() {
        if (!conn_.commit()) {
            rollback();
            THROW("commit() failed - transaction rolled back");
        }
        open_ = false;
    }

    // never throws: called from the destructor and from error paths
    void rollback() noexcept {
        open_ = false;
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            SPDLOG_ERROR("rollback failed: {}", e.what());
        }
    }

    bool open() const { return open_; }
    SQLConnection& conn() { return conn_; }

private:
    SQLConnection& conn_;
    bool open_ = true;
};

// Run fn(Transaction&) inside a transaction: commit on return, rollback + rethrow on error.
template <typename F>
auto with_transaction(SQLConnection& conn, F&& fn) -> std::invoke_result_t<F, Transaction&> {
    Transaction tr(conn);
    using R = std::invoke_result_t<F, Transaction&>;
    if constexpr (std::is_void_v<R>) {
        std::forward<F>(fn)(tr);
        tr.commit();
    } else {
        R result = std::forward<F>(fn)(tr);
        tr.commit();
        return result;
    }
}
