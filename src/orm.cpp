#include "orm.hpp"
#include <algorithm>
#include "lib.hpp"
#include "jsonhlp.hpp"

IndexSpec IndexSpec::parse(const std::string& text) {
    IndexSpec spec;
    std::string s = text;
    if (!s.empty() && s.front() == INDEX_REMOVE_MARK) {
        spec.remove = true;
        s.erase(0, 1);
    }
    auto pos = s.find(':');
    if (pos == std::string::npos) {
        spec.kind = s;
    } else {
        spec.kind = s.substr(0, pos);
        spec.opclass = s.substr(pos + 1);
    }
    return spec;
}

std::string IndexSpec::key() const {
    return opclass.empty() ? kind : kind + ":" + opclass;
}

std::string IndexSpec::str() const {
    return remove ? std::string(1, INDEX_REMOVE_MARK) + key() : key();
}

const IndexSpec* FieldSpec::find_index(const std::string& kind, bool removed) const {
    for (const auto& idx : indexes) {
        if (idx.kind == kind && idx.remove == removed) return &idx;
    }
    return nullptr;
}

const FieldSpec* SchemaSnapshot::field(const std::string& name) const {
    auto it = std::find_if(fields.begin(), fields.end(),
        [&](const FieldSpec& f) { return f.name == name; });
    return it == fields.end() ? nullptr : &*it;
}

const UniqueGroup* SchemaSnapshot::group(const std::string& name) const {
    auto it = std::find_if(unique_groups.begin(), unique_groups.end(),
        [&](const UniqueGroup& g) { return g.name == name; });
    return it == unique_groups.end() ? nullptr : &*it;
}

std::vector<UniqueGroup> SchemaSnapshot::effective_unique_groups() const {
    std::vector<UniqueGroup> out = unique_groups;
    for (const auto& f : fields) {
        if (f.unique) out.push_back(UniqueGroup { f.name, { f.name } });
    }
    return out;
}

std::string unique_constraint_name(const std::string& table, const std::string& group) {
    return "__UNQ_" + table + "_" + group + "__";
}

std::string index_name(const std::string& table, const std::string& field, const std::string& kind) {
    return "__IDX_" + table + "_" + field + "_" + kind + "__";
}

FieldSpec field_from_json(const std::string& name, const jval& j) {
    if (!j.IsObject()) THROW_AS(DeclarationError, "Field '%s' must be a JSON object", name.c_str());
    FieldSpec f;
    f.name = name;
    f.sql_type = jhlp::get<std::string>(j, PROP_SQL_TYPE);
    f.on_add = jhlp::get<std::string>(j, PROP_ON_ADD);
    f.alter_ops = jhlp::get_strings(j, PROP_ALTER);
    for (const auto& s : jhlp::get_strings(j, PROP_INDEX)) {
        f.indexes.push_back(IndexSpec::parse(s));
    }
    f.unique = jhlp::get<bool>(j, PROP_UNIQUE, false);
    return f;
}

jval field_to_json(const FieldSpec& f, jdaloc& a) {
    jval o(rapidjson::kObjectType);
    jhlp::set(o, PROP_SQL_TYPE, f.sql_type, a);
    jhlp::set(o, PROP_ON_ADD, f.on_add, a);
    jhlp::set(o, PROP_ALTER, f.alter_ops, a);
    std::vector<std::string> idx;
    for (const auto& i : f.indexes) idx.push_back(i.str());
    jhlp::set(o, PROP_INDEX, idx, a);
    jhlp::set(o, PROP_UNIQUE, f.unique, a);
    return o;
}

SchemaSnapshot SchemaSnapshot::from_json(const jval& j) {
    if (!j.IsObject()) THROW("Snapshot must be a JSON object");
    SchemaSnapshot s;
    s.table = jhlp::get<std::string>(j, PROP_TABLE);
    s.pk = jhlp::get<std::string>(j, PROP_PK);

    if (j.HasMember(PROP_FIELDS)) {
        const jval& flds = j[PROP_FIELDS];
        if (!flds.IsObject()) THROW("Snapshot '%s': fields must be an object", s.table.c_str());
        for (auto it = flds.MemberBegin(); it != flds.MemberEnd(); ++it) {
            s.fields.push_back(field_from_json(it->name.GetString(), it->value));
        }
    }
    if (j.HasMember(PROP_UNIQUE_GROUPS)) {
        const jval& grps = j[PROP_UNIQUE_GROUPS];
        if (!grps.IsObject()) THROW("Snapshot '%s': unique_groups must be an object", s.table.c_str());
        for (auto it = grps.MemberBegin(); it != grps.MemberEnd(); ++it) {
            UniqueGroup g;
            g.name = it->name.GetString();
            g.fields = jhlp::get_strings(grps, g.name);
            s.unique_groups.push_back(std::move(g));
        }
    }
    return s;
}

jval SchemaSnapshot::to_json(jdaloc& a) const {
    jval o(rapidjson::kObjectType);
    jhlp::set(o, PROP_TABLE, table, a);
    jhlp::set(o, PROP_PK, pk, a);
    jval flds(rapidjson::kObjectType);
    for (const auto& f : fields) {
        flds.AddMember(jhlp::str_val(f.name, a), field_to_json(f, a), a);
    }
    jhlp::set_value(o, PROP_FIELDS, std::move(flds), a);
    jval grps(rapidjson::kObjectType);
    for (const auto& g : unique_groups) {
        grps.AddMember(jhlp::str_val(g.name, a), jhlp::strings_val(g.fields, a), a);
    }
    jhlp::set_value(o, PROP_UNIQUE_GROUPS, std::move(grps), a);
    return o;
}
