#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "changeset.hpp"
#include "orm.hpp"
#include "snapshot_store.hpp"

#define QUEUE_DIR     ".queue"
#define TRASH_DIR     ".trash"
#define SEQUENCE_FILE ".sequence"

enum class UnitState { Queued, Applied, Failed };

std::string unit_state_name(UnitState state);
UnitState unit_state(const std::string& name);

/**
 * MigrationUnit
 *  - one queued change set with the SQL rendered when it was written
 *  - hooks are plain SQL lists the operator may edit before the unit runs
 *  - 'snapshot' is the table state once the unit applied (the next baseline)
 */
struct MigrationUnit {
    std::string model;
    int sequence = 0;
    std::string created_at;
    std::string applied_at;
    UnitState state = UnitState::Queued;
    std::string error;
    ChangeSet change_set;
    std::vector<std::string> sql;
    SchemaSnapshot snapshot;
    std::vector<std::string> run_before;
    std::vector<std::string> run_after;

    std::filesystem::path path; // file the unit was read from / written to

    bool applied() const { return state == UnitState::Applied; }

    jval to_json(jdaloc& a) const;
    static MigrationUnit from_json(const jval& j);
};

/**
 * MigrationQueue
 *  - the unit writer: <base>/<model>/.queue/<model>_<seq>_<timestamp>.json
 *  - sequences grow per model and are never reused: the next one is above
 *    every queued, applied, trashed or store-recorded number
 *  - callers hold the model's ModelLock around write / mark / delete
 */
class MigrationQueue {
public:
    MigrationQueue(const SnapshotStore& store, int index_length = 8);

    // Render SQL for 'cs' and queue it. Nothing is written for an empty change set.
    // GenerationError leaves the directory untouched.
    std::optional<MigrationUnit> write(const std::string& model, const ChangeSet& cs, const SchemaSnapshot& target);

    // units of 'model' in ascending sequence order
    std::vector<MigrationUnit> list(const std::string& model) const;

    // newest unit whatever its state
    std::optional<MigrationUnit> latest(const std::string& model) const;

    int next_sequence(const std::string& model) const;

    // Rewrite the unit's file with the new state (and error text for Failed).
    void mark(MigrationUnit& unit, UnitState state, const std::string& error = "");

    /**
     * @brief Move the units with start <= sequence <= end to .trash
     *
     * Throws MigrationError when start < 1 or start > end, or when a unit in
     * the range is already applied, by its own state or by the store's last
     * applied sequence (nothing is moved in that case).
     * Returns the number of units moved.
     */
    int delete_range(const std::string& model, int start, int end);

    // model directories found under the base directory
    std::vector<std::string> models() const;

    // "<model>_<padded sequence>", the name used in operator messages
    std::string unit_name(const std::string& model, int sequence) const;

    std::filesystem::path model_dir(const std::string& model) const { return store_.model_dir(model); }
    std::filesystem::path queue_dir(const std::string& model) const { return model_dir(model) / QUEUE_DIR; }
    std::filesystem::path trash_dir(const std::string& model) const { return model_dir(model) / TRASH_DIR; }

    static MigrationUnit load(const std::filesystem::path& file);
    static void save(const MigrationUnit& unit);

private:
    int high_water_mark(const std::string& model) const;
    void set_high_water_mark(const std::string& model, int sequence) const;
    static std::vector<MigrationUnit> read_dir(const std::filesystem::path& dir);

    const SnapshotStore& store_;
    int index_length_;
};
