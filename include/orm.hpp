#pragma once
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include "jsonhlp.hpp"

/****************** LITERAL CONSTS */
#define PROP_TABLE         "table"
#define PROP_PK            "pk"
#define PROP_FIELDS        "fields"
#define PROP_UNIQUE_GROUPS "unique_groups"
#define PROP_SQL_TYPE      "sql_type"
#define PROP_ON_ADD        "on_add"
#define PROP_ALTER         "alter"
#define PROP_INDEX         "index"
#define PROP_UNIQUE        "unique"

#define RESERVED_PREFIX    "__"
#define INDEX_REMOVE_MARK  '-'


/**
 * One requested index on a column: "[-]kind[:opclass]".
 * "-hash" asks generation to drop the hash index of the column.
 */
struct IndexSpec {
    std::string kind;    // btree, hash, gin, ...
    std::string opclass; // optional operator class, e.g. gin_trgm_ops
    bool remove = false; // leading '-' marker

    static IndexSpec parse(const std::string& text);
    std::string str() const;  // back to "[-]kind[:opclass]"
    std::string key() const;  // kind[:opclass] without the marker

    bool operator==(const IndexSpec&) const = default;
};

struct FieldSpec {
    std::string name;                   // column name, identity for diffing
    std::string sql_type;               // raw DDL type: varchar(65), SERIAL ...
    std::string on_add;                 // fragment used only on ADD COLUMN / CREATE TABLE
    std::vector<std::string> alter_ops; // ALTER COLUMN fragments: SET DEFAULT 'x', SET NOT NULL
    std::vector<IndexSpec> indexes;     // ordered, may carry removal markers
    bool unique = false;                // single column uniqueness

    const IndexSpec* find_index(const std::string& kind, bool removed = false) const;

    bool operator==(const FieldSpec&) const = default;
};

struct UniqueGroup {
    std::string name;                // used verbatim in the constraint id
    std::vector<std::string> fields; // order matters

    bool operator==(const UniqueGroup&) const = default;
};

/**
 * SchemaSnapshot
 *  - structural state of one model table: fields + unique groups
 *  - fields and groups keep declaration order (CREATE TABLE uses it),
 *    comparisons are done by name
 */
class SchemaSnapshot {
public:
    std::string table;
    std::string pk;
    std::vector<FieldSpec> fields;
    std::vector<UniqueGroup> unique_groups;

    const FieldSpec* field(const std::string& name) const;
    const UniqueGroup* group(const std::string& name) const;

    // explicit groups followed by one implicit group per unique field
    std::vector<UniqueGroup> effective_unique_groups() const;

    bool operator==(const SchemaSnapshot&) const = default;

    static SchemaSnapshot from_json(const jval& j);
    jval to_json(jdaloc& a) const;
};

// constraint / index identifiers
std::string unique_constraint_name(const std::string& table, const std::string& group);
std::string index_name(const std::string& table, const std::string& field, const std::string& kind);

FieldSpec field_from_json(const std::string& name, const jval& j);
jval field_to_json(const FieldSpec& f, jdaloc& a);
