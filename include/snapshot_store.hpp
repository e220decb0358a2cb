#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "orm.hpp"

#define APPLIED_FILE "applied.json"

// What the store knows about one model: the applied snapshot and the unit that produced it.
struct AppliedRecord {
    SchemaSnapshot snapshot;
    int last_applied_sequence = 0;

    bool operator==(const AppliedRecord&) const = default;
};

/**
 * SnapshotStore
 *  - <base>/<model>/applied.json, one record per model
 *  - snapshot and last applied sequence are written together in one
 *    atomic replace, never one without the other
 *  - only the runner saves, after the unit's transaction committed
 */
class SnapshotStore {
public:
    explicit SnapshotStore(std::filesystem::path base_dir);

    // nullopt when the model never had a unit applied
    std::optional<AppliedRecord> load(const std::string& model) const;

    void save(const std::string& model, const SchemaSnapshot& snapshot, int sequence);

    std::filesystem::path model_dir(const std::string& model) const { return base_ / model; }
    const std::filesystem::path& base_dir() const { return base_; }

private:
    std::filesystem::path base_;
};
