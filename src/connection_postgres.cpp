// connection_postgres.cpp
#include <string>
#include <vector>
#include <cstdlib>
#include <memory>
#include <lib.hpp>
#include "sqlconnection.hpp"

#if HAVE_POSTGRESQL
#include <libpq-fe.h>

namespace {
    // owns a PGresult for the scope of one call
    using PgResult = std::unique_ptr<PGresult, decltype(&PQclear)>;

    std::string pg_error(PGconn* conn) {
        std::string err = conn ? PQerrorMessage(conn) : "no connection";
        while (!err.empty() && (err.back() == '\n' || err.back() == ' ')) err.pop_back();
        return err;
    }
}

/*=============================  PgStatement  =============================*/
class PgStatement final : public SQLStatement {
public:
    PgStatement(PGconn* conn, std::string sql)
        : conn_(conn), sql_(std::move(sql)) { }

    ~PgStatement() override = default;

    // Bind positional parameter (1-based), always text format
    void bind(int idx, const jval& value) override {
        ensure_slot_(idx);
        bind_text(idx, value);
    }

    // Execute and return rows affected (INSERT/UPDATE/DELETE) or row count for SELECT
    int exec() override {
        PgResult res = run_();
        if (PQresultStatus(res.get()) == PGRES_TUPLES_OK) return PQntuples(res.get());
        const char* t = PQcmdTuples(res.get());
        return (t && *t) ? std::atoi(t) : 0;
    }

    jdoc fetch() override {
        PgResult res = run_();
        PGresult* r = res.get();
        jdoc rows(rapidjson::kArrayType);
        auto& a = rows.GetAllocator();
        const int cols = PQnfields(r);
        for (int i = 0, n = PQntuples(r); i < n; ++i) {
            jval row(rapidjson::kObjectType);
            for (int c = 0; c < cols; ++c) {
                jval v; // NULL stays null
                if (!PQgetisnull(r, i, c)) v = jhlp::str_val(PQgetvalue(r, i, c), a);
                row.AddMember(jhlp::str_val(PQfname(r, c), a), v, a);
            }
            rows.PushBack(row, a);
        }
        return rows;
    }

protected:
    void set_null(int idx) override {
        params_[idx-1]  = nullptr;  // SQL NULL
        lengths_[idx-1] = 0;
        formats_[idx-1] = 0;        // text format
    }

    void set_text(int idx, std::string value) override {
        values_[idx-1]  = std::move(value);        // own storage
        params_[idx-1]  = values_[idx-1].c_str();
        lengths_[idx-1] = static_cast<int>(values_[idx-1].size());
        formats_[idx-1] = 0;
    }

private:
    void ensure_slot_(int idx) {
        if (idx < 1) THROW("bind: index must be >= 1");
        if (static_cast<size_t>(idx) > params_.size()) {
            params_.resize(idx, nullptr);
            lengths_.resize(idx, 0);
            formats_.resize(idx, 0);
            values_.resize(idx);
            // values_ may have reallocated
            for (size_t i = 0; i < params_.size(); ++i) {
                if (params_[i]) params_[i] = values_[i].c_str();
            }
        }
    }

    // one statement per call; PQexecParams refuses multi statement strings
    PgResult run_() {
        const int n = static_cast<int>(params_.size());
        PgResult res(PQexecParams(conn_, sql_.c_str(), n, nullptr,
                         n ? params_.data() : nullptr,
                         n ? lengths_.data() : nullptr,
                         n ? formats_.data() : nullptr,
                         0),
            &PQclear);
        if (!res) THROW("Postgres exec failed: %s [%s]", pg_error(conn_).c_str(), sql_.c_str());

        auto st = PQresultStatus(res.get());
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK)
            THROW("Postgres exec failed: %s [%s]", pg_error(conn_).c_str(), sql_.c_str());
        return res;
    }

    PGconn* conn_;
    std::string sql_;
    std::vector<const char*> params_;
    std::vector<std::string> values_; // backing for params_
    std::vector<int> lengths_;
    std::vector<int> formats_;
};

/*=============================  PgConnection  =============================*/
class PgConnection final : public SQLConnection {
public:
    ~PgConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        conn_ = PQconnectdb(dsn.c_str());
        if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
            std::string err = pg_error(conn_);
            disconnect();
            THROW("Postgres connect failed: %s", err.c_str());
        }
        SPDLOG_DEBUG("Connected to PostgreSQL {} (db {})", PQserverVersion(conn_), PQdb(conn_));
    }

    void disconnect() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        tr_started_ = false;
    }

    // DDL is transactional on PostgreSQL, a unit runs inside one of these
    bool begin() override {
        if (tr_started_) return true;
        command("BEGIN");
        tr_started_ = true;
        return true;
    }

    bool commit() override {
        if (!tr_started_) return false;
        command("COMMIT");
        tr_started_ = false;
        return true;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        command("ROLLBACK");
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!conn_) THROW("prepare: not connected");
        return std::make_unique<PgStatement>(conn_, sql);
    }

    std::string driver() const override { return "postgres"; }

private:
    void command(const char* sql) {
        if (!conn_) THROW("%s: not connected", sql);
        PgResult res(PQexec(conn_, sql), &PQclear);
        if (!res || PQresultStatus(res.get()) != PGRES_COMMAND_OK)
            THROW("Postgres %s failed: %s", sql, pg_error(conn_).c_str());
    }

    PGconn* conn_ = nullptr;
};

PSQLConnection make_postgres_connection() {
    return std::make_unique<PgConnection>();
}
#else
PSQLConnection make_postgres_connection() {
    THROW("ormigrate was built without PostgreSQL support");
}
#endif
