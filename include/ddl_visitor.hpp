#pragma once
#include "orm.hpp"
#include "changeset.hpp"
#include <string>
#include <vector>

/**
 * DDLVisitor
 *  - renders change sets into ordered DDL statements (no trailing ';')
 *  - throws GenerationError for records it can not render, before anything
 *    is written to disk
 */
class DDLVisitor {
public:
    virtual ~DDLVisitor() = default;

    // CREATE TABLE + unique constraints + alter ops + indexes
    virtual std::vector<std::string> create_table(const SchemaSnapshot& schema) = 0;

    // Statements for 'cs' in dependency order
    virtual std::vector<std::string> visit(const std::string& table, const ChangeSet& cs) = 0;

    virtual std::string add_column(const std::string& table, const FieldSpec& f) = 0;
    virtual std::string drop_column(const std::string& table, const std::string& field) = 0;
    virtual std::string alter_column(const std::string& table, const std::string& field, const std::string& op) = 0;
    virtual std::string create_index(const std::string& table, const std::string& field, const IndexSpec& idx) = 0;
    virtual std::string drop_index(const std::string& table, const std::string& field, const IndexSpec& idx) = 0;
    virtual std::string add_unique(const std::string& table, const UniqueGroup& group) = 0;
    virtual std::string drop_unique(const std::string& table, const std::string& group) = 0;
    virtual std::string drop_table(const std::string& table) = 0;
};

/* ---------- PostgreSQL ---------- */

class PgDDLVisitor : public DDLVisitor {
public:
    std::vector<std::string> create_table(const SchemaSnapshot& schema) override;
    std::vector<std::string> visit(const std::string& table, const ChangeSet& cs) override;

    std::string add_column(const std::string& table, const FieldSpec& f) override;
    std::string drop_column(const std::string& table, const std::string& field) override;
    std::string alter_column(const std::string& table, const std::string& field, const std::string& op) override;
    std::string create_index(const std::string& table, const std::string& field, const IndexSpec& idx) override;
    std::string drop_index(const std::string& table, const std::string& field, const IndexSpec& idx) override;
    std::string add_unique(const std::string& table, const UniqueGroup& group) override;
    std::string drop_unique(const std::string& table, const std::string& group) override;
    std::string drop_table(const std::string& table) override;
};

// generate(table, changeSet) with the PostgreSQL visitor
std::vector<std::string> generate_sql(const std::string& table, const ChangeSet& cs);

// statements joined with ";\n", for display and for the unit file
std::string join_sql(const std::vector<std::string>& statements);
