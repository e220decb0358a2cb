#include "runner.hpp"
#include <algorithm>
#include <exception>
#include <thread>
#include "lib.hpp"
#include "model_lock.hpp"

bool RunReport::ok() const {
    return std::all_of(models.begin(), models.end(), [](const ModelOutcome& m) { return m.ok(); });
}

int RunReport::applied_count() const {
    int n = 0;
    for (const auto& m : models) n += static_cast<int>(m.applied.size());
    return n;
}

MigrationRunner::MigrationRunner(pool::IDbPool& db, SnapshotStore& store, MigrationQueue& queue)
    : db_(db), store_(store), queue_(queue) { }

void MigrationRunner::set_hooks(const std::string& model, std::shared_ptr<MigrationHooks> hooks) {
    hooks_[model] = std::move(hooks);
}

/* ---------- history table ---------- */

void MigrationRunner::ensure_history(SQLConnection& conn) {
    with_transaction(conn, [](Transaction& tr) {
        tr.execute("CREATE TABLE IF NOT EXISTS " + quote_ident(HISTORY_TABLE) + " ("
            "model TEXT NOT NULL, "
            "sequence INTEGER NOT NULL, "
            "applied_at TEXT NOT NULL, "
            "PRIMARY KEY (model, sequence))");
    });
}

std::set<int> MigrationRunner::history(SQLConnection& conn, const std::string& model) {
    std::set<int> out;
    jdoc rows = conn.fetch("SELECT sequence FROM " + quote_ident(HISTORY_TABLE)
        + " WHERE model = $1 ORDER BY sequence", { model });
    for (const auto& row : rows.GetArray()) {
        out.insert(std::stoi(jhlp::get<std::string>(row, "sequence")));
    }
    return out;
}

/* ---------- consistency ---------- */

void MigrationRunner::reconcile(SQLConnection& conn, const std::string& model, std::vector<MigrationUnit>& units) {
    std::set<int> done = history(conn, model);
    auto rec = store_.load(model);
    int last = rec ? rec->last_applied_sequence : 0;

    // committed in the database but the files never heard of it
    const MigrationUnit* newest = nullptr;
    for (auto& u : units) {
        bool in_db = done.count(u.sequence) > 0;
        if (u.applied() && !in_db)
            THROW_AS(HistoryConsistencyError, "Migration %s is marked applied but the database has no record of it",
                queue_.unit_name(model, u.sequence).c_str());
        if (!u.applied() && in_db) {
            SPDLOG_WARN("Migration {} was committed but not recorded, healing", queue_.unit_name(model, u.sequence));
            if (u.sequence > last) {
                store_.save(model, u.snapshot, u.sequence);
                last = u.sequence;
            }
            queue_.mark(u, UnitState::Applied);
        }
        if (u.applied()) newest = &u;
    }

    // applied units form a prefix of the queue
    bool gap = false;
    for (const auto& u : units) {
        if (!u.applied()) gap = true;
        else if (gap)
            THROW_AS(HistoryConsistencyError, "Migration %s is applied after a unit that is not",
                queue_.unit_name(model, u.sequence).c_str());
    }

    if (newest && newest->sequence > last) {
        SPDLOG_WARN("Snapshot of '{}' is behind migration {}, healing", model, queue_.unit_name(model, newest->sequence));
        store_.save(model, newest->snapshot, newest->sequence);
        last = newest->sequence;
    }
    for (const auto& u : units) {
        if (u.sequence <= last && !u.applied())
            THROW_AS(HistoryConsistencyError, "Snapshot of '%s' says sequence %d is applied but %s is %s",
                model.c_str(), last, queue_.unit_name(model, u.sequence).c_str(), unit_state_name(u.state).c_str());
    }
    for (int seq : done) {
        bool known = std::any_of(units.begin(), units.end(), [&](const MigrationUnit& u) { return u.sequence == seq; });
        if (!known && seq > last)
            THROW_AS(HistoryConsistencyError, "Database has migration %s but no unit file exists for it",
                queue_.unit_name(model, seq).c_str());
    }
}

void MigrationRunner::check(const ModelDecl& model) {
    ModelLock lock(queue_.model_dir(model.name()));
    auto lease = pool::acquire_or_throw(db_, pool::DbIntent::Write);
    ensure_history(lease.conn());
    auto units = queue_.list(model.name());
    reconcile(lease.conn(), model.name(), units);
}

/* ---------- apply ---------- */

void MigrationRunner::check_cancel() const {
    if (cancelled_) THROW("Migration cancelled");
}

void MigrationRunner::run_statements(Transaction& tr, const std::vector<std::string>& statements) {
    for (const auto& sql : statements) {
        check_cancel();
        SPDLOG_DEBUG("  {}", sql);
        tr.execute(sql);
    }
}

void MigrationRunner::apply_unit(SQLConnection& conn, const ModelDecl& model, MigrationUnit& unit) {
    const std::string& name = model.name();
    const std::string seq = std::to_string(unit.sequence);
    auto hooks = hooks_.find(name);

    try {
        Transaction tr(conn);
        if (tr.fetchval("SELECT sequence FROM " + quote_ident(HISTORY_TABLE)
                + " WHERE model = $1 AND sequence = $2", { name, seq }))
            THROW_AS(HistoryConsistencyError, "Migration %s was already applied",
                queue_.unit_name(name, unit.sequence).c_str());
        if (statement_timeout_ms_ > 0 && conn.driver() == "postgres")
            tr.execute("SET LOCAL statement_timeout = " + std::to_string(statement_timeout_ms_));

        run_statements(tr, unit.run_before);
        if (hooks != hooks_.end() && hooks->second) hooks->second->run_before(tr, model, unit);
        run_statements(tr, unit.sql);
        run_statements(tr, unit.run_after);
        if (hooks != hooks_.end() && hooks->second) hooks->second->run_after(tr, model, unit);

        check_cancel();
        tr.execute("INSERT INTO " + quote_ident(HISTORY_TABLE) + " (model, sequence, applied_at) VALUES ($1, $2, $3)",
            { name, seq, iso_timestamp() });
        tr.commit();
    } catch (const HistoryConsistencyError&) {
        throw;
    } catch (const std::exception& e) {
        // Transaction went out of scope: rolled back
        throw ApplyError(name, unit.sequence, e.what());
    }

    // committed: from here on the history row proves the unit ran
    store_.save(name, unit.snapshot, unit.sequence);
    queue_.mark(unit, UnitState::Applied);
}

ModelOutcome MigrationRunner::apply(const ModelDecl& model) {
    ModelOutcome out;
    out.model = model.name();

    ModelLock lock(queue_.model_dir(model.name()));
    auto lease = pool::acquire_or_throw(db_, pool::DbIntent::Write);
    SQLConnection& conn = lease.conn();
    ensure_history(conn);

    auto units = queue_.list(model.name());
    reconcile(conn, model.name(), units);

    auto pending = std::count_if(units.begin(), units.end(), [](const MigrationUnit& u) { return !u.applied(); });
    if (pending == 0) {
        SPDLOG_INFO("No migrations to apply for model {}", model.name());
        return out;
    }
    SPDLOG_INFO("=> Running migrations for model {}", model.name());

    for (auto& u : units) {
        if (u.applied()) continue;
        if (!out.ok() || cancelled_) {
            out.cancelled = cancelled_ && out.ok();
            ++out.pending;
            continue;
        }
        if (u.state == UnitState::Failed) SPDLOG_INFO("Retrying failed migration {}", queue_.unit_name(u.model, u.sequence));
        try {
            apply_unit(conn, model, u);
            out.applied.push_back(u.sequence);
            SPDLOG_INFO("Migration applied: {}", queue_.unit_name(u.model, u.sequence));
        } catch (const ApplyError& e) {
            SPDLOG_ERROR("Migration {} failed: {}", queue_.unit_name(u.model, u.sequence), e.db_error());
            queue_.mark(u, UnitState::Failed, e.db_error());
            out.failed = u.sequence;
            out.error = e.db_error();
        }
    }
    if (out.pending)
        SPDLOG_WARN("{} migration(s) of model {} left queued", out.pending, model.name());
    return out;
}

RunReport MigrationRunner::apply_all(const std::vector<const ModelDecl*>& models) {
    for (const auto* m : models) check(*m);

    RunReport report;
    report.models.resize(models.size());
    std::vector<std::exception_ptr> errors(models.size());

    std::atomic<std::size_t> next { 0 };
    auto worker = [&]() {
        for (std::size_t i = next++; i < models.size(); i = next++) {
            try {
                report.models[i] = apply(*models[i]);
            } catch (const std::exception& e) {
                SPDLOG_ERROR("Model {}: {}", models[i]->name(), e.what());
                report.models[i].model = models[i]->name();
                errors[i] = std::current_exception();
            }
        }
    };

    std::size_t workers = std::min(parallelism_, models.size());
    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        for (std::size_t t = 0; t < workers; ++t) threads.emplace_back(worker);
        for (auto& t : threads) t.join();
    }

    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
    return report;
}
