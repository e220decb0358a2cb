#pragma once
#include <optional>
#include <string>
#include <vector>
#include "orm.hpp"

enum class ChangeKind {
    AddField,
    DropField,
    AlterField,
    AddIndex,
    DropIndex,
    AddUniqueGroup,
    DropUniqueGroup,
    ModifyUniqueGroup,
    DropTable
};

std::string change_kind_name(ChangeKind kind);
ChangeKind change_kind(const std::string& name);

// One structural change. Only the members relevant to 'kind' are filled.
struct Change {
    ChangeKind kind;
    std::string field;                  // Add/Drop/AlterField, Add/DropIndex
    FieldSpec spec;                     // AddField (full definition), DropField (old definition)
    std::vector<std::string> alter_ops; // AlterField: only the fragments to run
    IndexSpec index;                    // Add/DropIndex
    UniqueGroup group;                  // Add/Modify: new group. Drop: name only
    std::string table;                  // DropTable: the old table

    bool operator==(const Change&) const = default;

    std::string describe() const; // one line, for operator messages
};

/**
 * ChangeSet
 *  - ordered result of a diff for one table
 *  - 'create' holds the whole target snapshot when the table is new (full create)
 *  - immutable once produced, serialized as is into the migration unit
 */
struct ChangeSet {
    std::string table;
    std::optional<SchemaSnapshot> create;
    std::vector<Change> changes;

    bool is_create() const { return create.has_value(); }
    bool empty() const { return !create && changes.empty(); }

    bool operator==(const ChangeSet&) const = default;

    jval to_json(jdaloc& a) const;
    static ChangeSet from_json(const jval& j);
};

// Change record factories
Change add_field(const FieldSpec& spec);
Change drop_field(const FieldSpec& old_spec);
Change alter_field(const std::string& field, std::vector<std::string> ops);
Change add_index(const std::string& field, const IndexSpec& index);
Change drop_index(const std::string& field, const IndexSpec& index);
Change add_unique_group(const UniqueGroup& group);
Change drop_unique_group(const std::string& name);
Change modify_unique_group(const UniqueGroup& group);
Change drop_table(const std::string& table);
