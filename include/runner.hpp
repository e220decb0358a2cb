#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "dbpool.hpp"
#include "migration_queue.hpp"
#include "model.hpp"
#include "snapshot_store.hpp"
#include "sqlconnection.hpp"

#define HISTORY_TABLE "__ormigrate_history__"

/**
 * MigrationHooks
 *  - C++ side of run_before / run_after, registered per model on the runner
 *  - both run inside the unit's transaction: a throw rolls the unit back
 */
class MigrationHooks {
public:
    virtual ~MigrationHooks() = default;
    virtual void run_before(Transaction& /*tr*/, const ModelDecl& /*model*/, const MigrationUnit& /*unit*/) { }
    virtual void run_after(Transaction& /*tr*/, const ModelDecl& /*model*/, const MigrationUnit& /*unit*/) { }
};

// What one apply pass did for one model.
struct ModelOutcome {
    std::string model;
    std::vector<int> applied;  // sequences applied in this pass
    int failed = 0;            // sequence of the failed unit, 0 when none failed
    std::string error;         // database / hook error text of the failed unit
    int pending = 0;           // units left queued behind a failure or a cancel
    bool cancelled = false;

    bool ok() const { return failed == 0; }
};

struct RunReport {
    std::vector<ModelOutcome> models;

    bool ok() const;
    int applied_count() const;
};

/**
 * MigrationRunner
 *  - applies the queued units of a model in ascending sequence order, one
 *    transaction per unit: run_before, the unit SQL, run_after, history row,
 *    commit, then the snapshot store and the unit file
 *  - the first failing unit is marked failed and halts its model, other
 *    models go on
 *  - the history table is the proof of application: it heals a crash between
 *    commit and the file updates and refuses a second application
 */
class MigrationRunner {
public:
    MigrationRunner(pool::IDbPool& db, SnapshotStore& store, MigrationQueue& queue);

    void set_hooks(const std::string& model, std::shared_ptr<MigrationHooks> hooks);

    // SET LOCAL statement_timeout on PostgreSQL, 0 = disabled
    void set_statement_timeout(int ms) { statement_timeout_ms_ = ms; }

    // models applied at the same time, each on its own connection
    void set_parallelism(std::size_t workers) { parallelism_ = workers ? workers : 1; }

    /**
     * @brief Compare store, unit files and history for one model
     *
     * Units recorded in the history table but not marked applied on disk are
     * healed forward (store saved, unit marked). Anything else that does not
     * add up throws HistoryConsistencyError.
     */
    void check(const ModelDecl& model);

    // Check + apply the pending units of one model.
    // ApplyError is recorded in the outcome, other errors propagate.
    ModelOutcome apply(const ModelDecl& model);

    // check() every model first, then apply them (in parallel when allowed).
    RunReport apply_all(const std::vector<const ModelDecl*>& models);

    // Stop before the next statement; the running unit rolls back and is marked failed.
    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }

    static void ensure_history(SQLConnection& conn);
    static std::set<int> history(SQLConnection& conn, const std::string& model);

private:
    void reconcile(SQLConnection& conn, const std::string& model, std::vector<MigrationUnit>& units);
    void apply_unit(SQLConnection& conn, const ModelDecl& model, MigrationUnit& unit);
    void run_statements(Transaction& tr, const std::vector<std::string>& statements);
    void check_cancel() const;

    pool::IDbPool& db_;
    SnapshotStore& store_;
    MigrationQueue& queue_;
    std::map<std::string, std::shared_ptr<MigrationHooks>> hooks_;
    int statement_timeout_ms_ = 0;
    std::size_t parallelism_ = 1;
    std::atomic<bool> cancelled_ { false };
};
