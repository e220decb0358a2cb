#pragma once
#include "orm.hpp"
#include "changeset.hpp"
#include <vector>
#include <string>

/**
 * SchemaUpdate
 *  - compares the baseline snapshot of a table with the declared one
 *  - fields and unique groups are matched by name and visited in name order,
 *    so the same pair of snapshots always gives the same ChangeSet
 *  - no rename detection: a renamed column is a drop plus an add
 */
class SchemaUpdate {
public:
    // old_schema == nullptr means the table never existed (full create)
    SchemaUpdate(const SchemaSnapshot* old_schema, const SchemaSnapshot& new_schema);

    // Throws DiffError when both snapshots exist but describe different tables.
    ChangeSet diff() const;

private:
    void diff_field(const FieldSpec& of, const FieldSpec& nf, std::vector<Change>& out) const;
    void diff_indexes(const FieldSpec& of, const FieldSpec& nf, std::vector<Change>& out) const;
    void diff_groups(std::vector<Change>& out) const;

    const SchemaSnapshot* old_schema_;
    const SchemaSnapshot& new_schema_;
};

// Pure diff of two snapshots of the same table.
ChangeSet diff(const SchemaSnapshot* old_schema, const SchemaSnapshot& new_schema);

// Planner entry: like diff() but a table name change becomes
// "create the new table + drop the old one" instead of a DiffError.
ChangeSet plan_changes(const SchemaSnapshot* baseline, const SchemaSnapshot& declared);

// ALTER COLUMN fragments needed to turn 'of' into 'nf' (empty when nothing to run)
std::vector<std::string> alter_ops_between(const FieldSpec& of, const FieldSpec& nf);
