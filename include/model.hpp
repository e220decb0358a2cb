#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "orm.hpp"

/**
 * ModelDecl
 *  - explicit declaration of one model: name, table, ordered fields and
 *    named unique groups
 *  - built in C++ with the fluent setters or loaded from JSON
 *  - describe() turns it into the SchemaSnapshot the migration engine diffs
 */
class ModelDecl {
public:
    explicit ModelDecl(std::string name);

    ModelDecl& table(std::string table);
    ModelDecl& pk(std::string field);
    ModelDecl& field(FieldSpec spec);
    ModelDecl& field(std::string name, std::string sql_type, std::string on_add = "");
    ModelDecl& unique_group(std::string name, std::vector<std::string> fields);
    ModelDecl& abstract(bool value = true);
    ModelDecl& proxy(bool value = true);

    const std::string& name() const { return name_; }
    const std::string& db_table() const { return table_.empty() ? name_ : table_; }
    const std::string& pk() const { return pk_; }
    const std::vector<FieldSpec>& fields() const { return fields_; }
    const std::vector<UniqueGroup>& unique_groups() const { return groups_; }
    bool is_abstract() const { return abstract_; }
    bool is_proxy() const { return proxy_; }

    /**
     * @brief Validate the declaration and build its snapshot
     *
     * Throws DeclarationError for:
     *  - empty table name, empty/duplicate/reserved ("__" prefixed) field names
     *  - a field without sql type, an index with an empty kind
     *  - duplicate, empty or reserved unique group names, groups without fields,
     *    groups referencing undeclared fields, group names clashing with a unique field
     *  - a pk that is not a declared field
     */
    SchemaSnapshot describe() const;

    // { "name", "table", "abstract", "proxy", "pk", "fields": [ {name, sql_type, ...} ],
    //   "unique_groups": { name: [fields] } }
    static ModelDecl from_json(const jval& j);

private:
    std::string name_;
    std::string table_;
    std::string pk_;
    std::vector<FieldSpec> fields_;
    std::vector<UniqueGroup> groups_;
    bool abstract_ = false;
    bool proxy_ = false;
};

// Builder helper: make_field("profession", "varchar(65)").alter("SET NOT NULL")...
class FieldBuilder {
public:
    FieldBuilder(std::string name, std::string sql_type);

    FieldBuilder& on_add(std::string fragment);
    FieldBuilder& alter(std::string fragment);
    FieldBuilder& index(const std::string& spec);
    FieldBuilder& unique(bool value = true);

    operator FieldSpec() const { return spec_; }
    const FieldSpec& spec() const { return spec_; }

private:
    FieldSpec spec_;
};

inline FieldBuilder make_field(std::string name, std::string sql_type) {
    return FieldBuilder(std::move(name), std::move(sql_type));
}

/**
 * ModelRegistry
 *  - the set of models handed to the migration engine (no global state)
 *  - keeps registration order, names are unique
 */
class ModelRegistry {
public:
    void add(ModelDecl model);
    bool has(const std::string& name) const;
    const ModelDecl& get(const std::string& name) const;
    const std::vector<std::shared_ptr<ModelDecl>>& all() const { return models_; }
    std::size_t size() const { return models_.size(); }

    // array of model objects, or { "models": [...] }
    static ModelRegistry from_json(const jval& j);
    static ModelRegistry from_file(const std::string& path);

private:
    std::vector<std::shared_ptr<ModelDecl>> models_;
    std::map<std::string, std::shared_ptr<ModelDecl>> by_name_;
};
