#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "changeset.hpp"
#include "dbpool.hpp"
#include "migration_queue.hpp"
#include "model.hpp"
#include "runner.hpp"
#include "snapshot_store.hpp"

/**
 * Migration
 *  - operator actions over a model registry: make (diff + queue), run
 *    (apply), delete a range of queued units, status
 *  - an empty model list means every concrete model of the registry;
 *    naming an abstract or proxy model throws ModelNotAllowedError
 */
class Migration {
public:
    // false declines the change set: nothing is queued for that model
    using Confirm = std::function<bool(const std::string& model, const ChangeSet& cs, const std::vector<std::string>& sql)>;

    struct MakeOptions {
        bool yes = false;                // queue without asking
        std::vector<std::string> models; // empty = all
        Confirm confirm;                 // asked when !yes
    };

    // db may be null when only make / delete / status are used
    Migration(const ModelRegistry& registry, std::filesystem::path migration_dir,
        pool::IDbPool* db = nullptr, int index_length = 8);

    std::vector<MigrationUnit> make_migrations(const MakeOptions& opts);

    // Applies every selected model; when a unit failed the first ApplyError
    // is thrown once all models were processed.
    RunReport run(const std::vector<std::string>& models = {});

    int delete_migration_files(int start, int end, const std::vector<std::string>& models = {});

    std::vector<std::pair<std::string, std::vector<MigrationUnit>>> status(const std::vector<std::string>& models = {}) const;

    // newest unit target, or the applied snapshot when the store is ahead of every unit
    std::optional<SchemaSnapshot> baseline(const std::string& model) const;

    // the registry models an action works on
    std::vector<const ModelDecl*> select(const std::vector<std::string>& names) const;

    MigrationRunner& runner();
    SnapshotStore& store() { return store_; }
    MigrationQueue& queue() { return queue_; }

private:
    const ModelRegistry& registry_;
    SnapshotStore store_;
    MigrationQueue queue_;
    std::unique_ptr<MigrationRunner> runner_;
};
