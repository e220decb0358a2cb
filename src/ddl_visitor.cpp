#include "ddl_visitor.hpp"
#include <cctype>
#include <sstream>
#include "lib.hpp"

namespace {

    // index kinds and operator classes are emitted unquoted
    bool plain_word(const std::string& s) {
        if (s.empty()) return false;
        for (char c : s) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
        }
        return true;
    }

    void require(bool ok, const char* what, const std::string& table) {
        if (!ok) THROW_AS(GenerationError, "Table '%s': %s", table.c_str(), what);
    }

    std::string column_list(const std::vector<std::string>& fields) {
        std::ostringstream ss;
        for (size_t i = 0; i < fields.size(); ++i) {
            ss << quote_ident(fields[i]);
            if (i + 1 < fields.size()) ss << ", ";
        }
        return ss.str();
    }

    std::string column_def(const FieldSpec& f) {
        std::string def = quote_ident(f.name) + " " + f.sql_type;
        if (!f.on_add.empty()) def += " " + f.on_add;
        return def;
    }

}

/* ---------- PostgreSQL ---------- */

std::string PgDDLVisitor::add_column(const std::string& table, const FieldSpec& f) {
    require(!f.name.empty(), "column without name", table);
    require(!f.sql_type.empty(), "column without sql type", table);
    return "ALTER TABLE " + quote_ident(table) + " ADD COLUMN " + column_def(f);
}

std::string PgDDLVisitor::drop_column(const std::string& table, const std::string& field) {
    require(!field.empty(), "drop of a column without name", table);
    return "ALTER TABLE " + quote_ident(table) + " DROP COLUMN " + quote_ident(field);
}

std::string PgDDLVisitor::alter_column(const std::string& table, const std::string& field, const std::string& op) {
    require(!field.empty(), "alter of a column without name", table);
    require(!op.empty(), "empty ALTER COLUMN fragment", table);
    return "ALTER TABLE " + quote_ident(table) + " ALTER COLUMN " + quote_ident(field) + " " + op;
}

std::string PgDDLVisitor::create_index(const std::string& table, const std::string& field, const IndexSpec& idx) {
    require(plain_word(idx.kind), "index kind must be a plain word", table);
    require(idx.opclass.empty() || plain_word(idx.opclass), "operator class must be a plain word", table);
    std::string sql = "CREATE INDEX IF NOT EXISTS " + quote_ident(index_name(table, field, idx.kind))
        + " ON " + quote_ident(table) + " USING " + idx.kind + " (" + quote_ident(field);
    if (!idx.opclass.empty()) sql += " " + idx.opclass;
    return sql + ")";
}

std::string PgDDLVisitor::drop_index(const std::string& table, const std::string& field, const IndexSpec& idx) {
    require(plain_word(idx.kind), "index kind must be a plain word", table);
    return "DROP INDEX IF EXISTS " + quote_ident(index_name(table, field, idx.kind));
}

std::string PgDDLVisitor::add_unique(const std::string& table, const UniqueGroup& group) {
    require(!group.name.empty(), "unique group without name", table);
    require(!group.fields.empty(), "unique group without fields", table);
    return "ALTER TABLE " + quote_ident(table) + " ADD CONSTRAINT "
        + quote_ident(unique_constraint_name(table, group.name)) + " UNIQUE (" + column_list(group.fields) + ")";
}

std::string PgDDLVisitor::drop_unique(const std::string& table, const std::string& group) {
    require(!group.empty(), "drop of a unique group without name", table);
    return "ALTER TABLE " + quote_ident(table) + " DROP CONSTRAINT IF EXISTS "
        + quote_ident(unique_constraint_name(table, group));
}

std::string PgDDLVisitor::drop_table(const std::string& table) {
    require(!table.empty(), "drop of a table without name", table);
    return "DROP TABLE IF EXISTS " + quote_ident(table);
}

std::vector<std::string> PgDDLVisitor::create_table(const SchemaSnapshot& schema) {
    const std::string& t = schema.table;
    require(!t.empty(), "CREATE TABLE without table name", t);
    require(!schema.fields.empty(), "CREATE TABLE without columns", t);

    std::ostringstream ddl;
    ddl << "CREATE TABLE " << quote_ident(t) << " (\n";
    for (size_t i = 0; i < schema.fields.size(); ++i) {
        const FieldSpec& f = schema.fields[i];
        require(!f.name.empty() && !f.sql_type.empty(), "column without name or sql type", t);
        ddl << "    " << column_def(f);
        if (i + 1 < schema.fields.size() || !schema.pk.empty()) ddl << ",";
        ddl << "\n";
    }
    if (!schema.pk.empty()) ddl << "    PRIMARY KEY (" << quote_ident(schema.pk) << ")\n";
    ddl << ")";

    std::vector<std::string> out { ddl.str() };
    // constraints reference columns created by the statement above
    for (const auto& g : schema.effective_unique_groups()) out.push_back(add_unique(t, g));
    for (const auto& f : schema.fields) {
        for (const auto& op : f.alter_ops) out.push_back(alter_column(t, f.name, op));
    }
    for (const auto& f : schema.fields) {
        for (const auto& idx : f.indexes) {
            if (!idx.remove) out.push_back(create_index(t, f.name, idx));
        }
    }
    return out;
}

std::vector<std::string> PgDDLVisitor::visit(const std::string& table, const ChangeSet& cs) {
    std::vector<std::string> out;

    if (cs.is_create()) {
        if (cs.create->table != table)
            THROW_AS(GenerationError, "Change set creates '%s' but was rendered for '%s'",
                cs.create->table.c_str(), table.c_str());
        out = create_table(*cs.create);
        for (const auto& c : cs.changes) {
            if (c.kind != ChangeKind::DropTable)
                THROW_AS(GenerationError, "Table '%s': '%s' can not follow a CREATE TABLE",
                    table.c_str(), change_kind_name(c.kind).c_str());
            out.push_back(drop_table(c.table));
        }
        return out;
    }

    // drop what references columns, then columns; add columns, then what references them
    std::vector<std::string> drop_uniques, drop_indexes, drop_columns, add_columns, alters, add_indexes, add_uniques;
    for (const auto& c : cs.changes) {
        switch (c.kind) {
            case ChangeKind::DropUniqueGroup:
                drop_uniques.push_back(drop_unique(table, c.group.name));
                break;
            case ChangeKind::ModifyUniqueGroup:
                drop_uniques.push_back(drop_unique(table, c.group.name));
                add_uniques.push_back(add_unique(table, c.group));
                break;
            case ChangeKind::DropIndex:
                drop_indexes.push_back(drop_index(table, c.field, c.index));
                break;
            case ChangeKind::DropField:
                drop_columns.push_back(drop_column(table, c.field));
                break;
            case ChangeKind::AddField:
                add_columns.push_back(add_column(table, c.spec));
                break;
            case ChangeKind::AlterField:
                require(!c.alter_ops.empty(), "ALTER COLUMN without fragments", table);
                for (const auto& op : c.alter_ops) alters.push_back(alter_column(table, c.field, op));
                break;
            case ChangeKind::AddIndex:
                add_indexes.push_back(create_index(table, c.field, c.index));
                break;
            case ChangeKind::AddUniqueGroup:
                add_uniques.push_back(add_unique(table, c.group));
                break;
            case ChangeKind::DropTable:
                THROW_AS(GenerationError, "Table '%s': DROP TABLE is only valid after a CREATE TABLE", table.c_str());
        }
    }
    for (auto* part : { &drop_uniques, &drop_indexes, &drop_columns, &add_columns, &alters, &add_indexes, &add_uniques }) {
        out.insert(out.end(), part->begin(), part->end());
    }
    return out;
}

std::vector<std::string> generate_sql(const std::string& table, const ChangeSet& cs) {
    PgDDLVisitor pg;
    return pg.visit(table, cs);
}

std::string join_sql(const std::vector<std::string>& statements) {
    std::string out;
    for (const auto& s : statements) {
        if (!out.empty()) out += "\n";
        out += s + ";";
    }
    return out;
}
