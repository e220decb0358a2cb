#include "model.hpp"
#include <cctype>
#include <set>
#include "lib.hpp"

namespace {

    bool valid_identifier(const std::string& name) {
        if (name.empty()) return false;
        if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
        for (char c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
        }
        return true;
    }

    bool reserved(const std::string& name) {
        return name.rfind(RESERVED_PREFIX, 0) == 0;
    }

}

/* ---------- FieldBuilder ---------- */

FieldBuilder::FieldBuilder(std::string name, std::string sql_type) {
    spec_.name = std::move(name);
    spec_.sql_type = std::move(sql_type);
}

FieldBuilder& FieldBuilder::on_add(std::string fragment) { spec_.on_add = std::move(fragment); return *this; }
FieldBuilder& FieldBuilder::alter(std::string fragment) { spec_.alter_ops.push_back(std::move(fragment)); return *this; }
FieldBuilder& FieldBuilder::index(const std::string& spec) { spec_.indexes.push_back(IndexSpec::parse(spec)); return *this; }
FieldBuilder& FieldBuilder::unique(bool value) { spec_.unique = value; return *this; }

/* ---------- ModelDecl ---------- */

ModelDecl::ModelDecl(std::string name) : name_(std::move(name)) { }

ModelDecl& ModelDecl::table(std::string table) { table_ = std::move(table); return *this; }
ModelDecl& ModelDecl::pk(std::string field) { pk_ = std::move(field); return *this; }
ModelDecl& ModelDecl::field(FieldSpec spec) { fields_.push_back(std::move(spec)); return *this; }
ModelDecl& ModelDecl::abstract(bool value) { abstract_ = value; return *this; }
ModelDecl& ModelDecl::proxy(bool value) { proxy_ = value; return *this; }

ModelDecl& ModelDecl::field(std::string name, std::string sql_type, std::string on_add) {
    FieldSpec f;
    f.name = std::move(name);
    f.sql_type = std::move(sql_type);
    f.on_add = std::move(on_add);
    return field(std::move(f));
}

ModelDecl& ModelDecl::unique_group(std::string name, std::vector<std::string> fields) {
    groups_.push_back(UniqueGroup { std::move(name), std::move(fields) });
    return *this;
}

SchemaSnapshot ModelDecl::describe() const {
    const std::string& tbl = db_table();
    if (tbl.empty()) THROW_AS(DeclarationError, "Model has no table name");
    if (reserved(tbl)) THROW_AS(DeclarationError, "Model '%s': table name '%s' uses the reserved prefix", name_.c_str(), tbl.c_str());

    SchemaSnapshot s;
    s.table = tbl;
    s.pk = pk_;

    std::set<std::string> names;
    for (const auto& f : fields_) {
        if (!valid_identifier(f.name))
            THROW_AS(DeclarationError, "Model '%s': invalid field name '%s'", name_.c_str(), f.name.c_str());
        if (reserved(f.name))
            THROW_AS(DeclarationError, "Model '%s': field name '%s' uses the reserved prefix '%s'", name_.c_str(), f.name.c_str(), RESERVED_PREFIX);
        if (!names.insert(f.name).second)
            THROW_AS(DeclarationError, "Model '%s': duplicate field '%s'", name_.c_str(), f.name.c_str());
        if (f.sql_type.empty())
            THROW_AS(DeclarationError, "Model '%s': field '%s' has no sql type", name_.c_str(), f.name.c_str());
        std::set<std::string> kinds;
        for (const auto& idx : f.indexes) {
            if (idx.kind.empty())
                THROW_AS(DeclarationError, "Model '%s': field '%s' has an index without kind", name_.c_str(), f.name.c_str());
            // one entry per kind: "btree" and "-btree" together are contradictory
            if (!kinds.insert(idx.kind).second)
                THROW_AS(DeclarationError, "Model '%s': field '%s' lists index kind '%s' twice",
                    name_.c_str(), f.name.c_str(), idx.kind.c_str());
        }
        s.fields.push_back(f);
    }

    if (!pk_.empty() && !names.count(pk_))
        THROW_AS(DeclarationError, "Model '%s': primary key '%s' is not a declared field", name_.c_str(), pk_.c_str());

    std::set<std::string> groups;
    for (const auto& g : groups_) {
        if (g.name.empty() || reserved(g.name))
            THROW_AS(DeclarationError, "Model '%s': invalid unique group name '%s'", name_.c_str(), g.name.c_str());
        if (!groups.insert(g.name).second)
            THROW_AS(DeclarationError, "Model '%s': duplicate unique group '%s'", name_.c_str(), g.name.c_str());
        if (g.fields.empty())
            THROW_AS(DeclarationError, "Model '%s': unique group '%s' has no fields", name_.c_str(), g.name.c_str());
        for (const auto& fname : g.fields) {
            if (!names.count(fname))
                THROW_AS(DeclarationError, "Model '%s': unique group '%s' references unknown field '%s'",
                    name_.c_str(), g.name.c_str(), fname.c_str());
        }
        const FieldSpec* same = s.field(g.name);
        if (same && same->unique)
            THROW_AS(DeclarationError, "Model '%s': unique group '%s' clashes with unique field of the same name",
                name_.c_str(), g.name.c_str());
        s.unique_groups.push_back(g);
    }
    return s;
}

ModelDecl ModelDecl::from_json(const jval& j) {
    if (!j.IsObject()) THROW_AS(DeclarationError, "Model declaration must be a JSON object");
    ModelDecl m(jhlp::get<std::string>(j, "name"));
    if (m.name_.empty()) THROW_AS(DeclarationError, "Model declaration without name");
    m.table_ = jhlp::get<std::string>(j, PROP_TABLE);
    m.pk_ = jhlp::get<std::string>(j, PROP_PK);
    m.abstract_ = jhlp::get<bool>(j, "abstract", false);
    m.proxy_ = jhlp::get<bool>(j, "proxy", false);

    if (j.HasMember(PROP_FIELDS)) {
        const jval& flds = j[PROP_FIELDS];
        if (!flds.IsArray()) THROW_AS(DeclarationError, "Model '%s': fields must be an array", m.name_.c_str());
        for (const auto& fj : flds.GetArray()) {
            m.fields_.push_back(field_from_json(jhlp::get<std::string>(fj, "name"), fj));
        }
    }
    if (j.HasMember(PROP_UNIQUE_GROUPS)) {
        const jval& grps = j[PROP_UNIQUE_GROUPS];
        if (!grps.IsObject()) THROW_AS(DeclarationError, "Model '%s': unique_groups must be an object", m.name_.c_str());
        for (auto it = grps.MemberBegin(); it != grps.MemberEnd(); ++it) {
            m.unique_group(it->name.GetString(), jhlp::get_strings(grps, it->name.GetString()));
        }
    }
    return m;
}

/* ---------- ModelRegistry ---------- */

void ModelRegistry::add(ModelDecl model) {
    if (by_name_.count(model.name()))
        THROW_AS(DeclarationError, "Model '%s' registered twice", model.name().c_str());
    auto p = std::make_shared<ModelDecl>(std::move(model));
    by_name_[p->name()] = p;
    models_.push_back(std::move(p));
}

bool ModelRegistry::has(const std::string& name) const {
    return by_name_.find(name) != by_name_.end();
}

const ModelDecl& ModelRegistry::get(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) THROW("Unknown model: %s", name.c_str());
    return *it->second;
}

ModelRegistry ModelRegistry::from_json(const jval& j) {
    const jval* arr = &j;
    if (j.IsObject() && j.HasMember("models")) arr = &j["models"];
    if (!arr->IsArray()) THROW_AS(DeclarationError, "Models must be a JSON array");
    ModelRegistry reg;
    for (const auto& mj : arr->GetArray()) {
        reg.add(ModelDecl::from_json(mj));
    }
    return reg;
}

ModelRegistry ModelRegistry::from_file(const std::string& path) {
    jdoc doc;
    jhlp::load_file(path, doc);
    return from_json(doc);
}
