#include "changeset.hpp"
#include <sstream>
#include "lib.hpp"

std::string change_kind_name(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::AddField         : return "add_field";
        case ChangeKind::DropField        : return "drop_field";
        case ChangeKind::AlterField       : return "alter_field";
        case ChangeKind::AddIndex         : return "add_index";
        case ChangeKind::DropIndex        : return "drop_index";
        case ChangeKind::AddUniqueGroup   : return "add_unique_group";
        case ChangeKind::DropUniqueGroup  : return "drop_unique_group";
        case ChangeKind::ModifyUniqueGroup: return "modify_unique_group";
        case ChangeKind::DropTable        : return "drop_table";
    }
    THROW("Invalid change kind value: %d", static_cast<int>(kind));
}

ChangeKind change_kind(const std::string& name) {
    if (name == "add_field"          ) return ChangeKind::AddField;
    if (name == "drop_field"         ) return ChangeKind::DropField;
    if (name == "alter_field"        ) return ChangeKind::AlterField;
    if (name == "add_index"          ) return ChangeKind::AddIndex;
    if (name == "drop_index"         ) return ChangeKind::DropIndex;
    if (name == "add_unique_group"   ) return ChangeKind::AddUniqueGroup;
    if (name == "drop_unique_group"  ) return ChangeKind::DropUniqueGroup;
    if (name == "modify_unique_group") return ChangeKind::ModifyUniqueGroup;
    if (name == "drop_table"         ) return ChangeKind::DropTable;
    THROW("Invalid change kind name: %s", name.c_str());
}

std::string Change::describe() const {
    std::ostringstream ss;
    auto list = [&](const std::vector<std::string>& items) {
        for (size_t i = 0; i < items.size(); ++i) ss << (i ? ", " : "") << items[i];
    };
    switch (kind) {
        case ChangeKind::AddField:
            ss << "ADD: " << field << ": " << spec.sql_type;
            if (!spec.on_add.empty()) ss << " " << spec.on_add;
            break;
        case ChangeKind::DropField:
            ss << "DROP: " << field;
            break;
        case ChangeKind::AlterField:
            ss << "ALTER: " << field << ": ";
            list(alter_ops);
            break;
        case ChangeKind::AddIndex:
            ss << "ADD INDEX: " << field << ": " << index.key();
            break;
        case ChangeKind::DropIndex:
            ss << "DROP INDEX: " << field << ": " << index.kind;
            break;
        case ChangeKind::AddUniqueGroup:
            ss << "ADD UNIQUE: " << group.name << ": (";
            list(group.fields);
            ss << ")";
            break;
        case ChangeKind::DropUniqueGroup:
            ss << "DROP UNIQUE: " << group.name;
            break;
        case ChangeKind::ModifyUniqueGroup:
            ss << "MODIFY UNIQUE: " << group.name << ": (";
            list(group.fields);
            ss << ")";
            break;
        case ChangeKind::DropTable:
            ss << "DROP TABLE: " << table;
            break;
    }
    return ss.str();
}

/* ---------- factories ---------- */

Change add_field(const FieldSpec& spec) {
    Change c { ChangeKind::AddField };
    c.field = spec.name;
    c.spec = spec;
    return c;
}

Change drop_field(const FieldSpec& old_spec) {
    Change c { ChangeKind::DropField };
    c.field = old_spec.name;
    c.spec = old_spec;
    return c;
}

Change alter_field(const std::string& field, std::vector<std::string> ops) {
    Change c { ChangeKind::AlterField };
    c.field = field;
    c.alter_ops = std::move(ops);
    return c;
}

Change add_index(const std::string& field, const IndexSpec& index) {
    Change c { ChangeKind::AddIndex };
    c.field = field;
    c.index = index;
    c.index.remove = false;
    return c;
}

Change drop_index(const std::string& field, const IndexSpec& index) {
    Change c { ChangeKind::DropIndex };
    c.field = field;
    c.index = index;
    c.index.remove = true;
    return c;
}

Change add_unique_group(const UniqueGroup& group) {
    Change c { ChangeKind::AddUniqueGroup };
    c.group = group;
    return c;
}

Change drop_unique_group(const std::string& name) {
    Change c { ChangeKind::DropUniqueGroup };
    c.group.name = name;
    return c;
}

Change modify_unique_group(const UniqueGroup& group) {
    Change c { ChangeKind::ModifyUniqueGroup };
    c.group = group;
    return c;
}

Change drop_table(const std::string& table) {
    Change c { ChangeKind::DropTable };
    c.table = table;
    return c;
}

/* ---------- json ---------- */

namespace {

    jval change_to_json(const Change& c, jdaloc& a) {
        jval o(rapidjson::kObjectType);
        jhlp::set(o, "op", change_kind_name(c.kind), a);
        switch (c.kind) {
            case ChangeKind::AddField:
            case ChangeKind::DropField:
                jhlp::set(o, "field", c.field, a);
                jhlp::set_value(o, "def", field_to_json(c.spec, a), a);
                break;
            case ChangeKind::AlterField:
                jhlp::set(o, "field", c.field, a);
                jhlp::set(o, "ops", c.alter_ops, a);
                break;
            case ChangeKind::AddIndex:
            case ChangeKind::DropIndex:
                jhlp::set(o, "field", c.field, a);
                jhlp::set(o, "index", c.index.str(), a);
                break;
            case ChangeKind::AddUniqueGroup:
            case ChangeKind::ModifyUniqueGroup:
                jhlp::set(o, "group", c.group.name, a);
                jhlp::set(o, "fields", c.group.fields, a);
                break;
            case ChangeKind::DropUniqueGroup:
                jhlp::set(o, "group", c.group.name, a);
                break;
            case ChangeKind::DropTable:
                jhlp::set(o, "table", c.table, a);
                break;
        }
        return o;
    }

    Change change_from_json(const jval& o) {
        Change c { change_kind(jhlp::get<std::string>(o, "op")) };
        c.field = jhlp::get<std::string>(o, "field");
        if (o.HasMember("def")) c.spec = field_from_json(c.field, o["def"]);
        c.alter_ops = jhlp::get_strings(o, "ops");
        if (o.HasMember("index")) c.index = IndexSpec::parse(jhlp::get<std::string>(o, "index"));
        c.group.name = jhlp::get<std::string>(o, "group");
        c.group.fields = jhlp::get_strings(o, "fields");
        c.table = jhlp::get<std::string>(o, "table");
        return c;
    }

}

jval ChangeSet::to_json(jdaloc& a) const {
    jval o(rapidjson::kObjectType);
    jhlp::set(o, "table", table, a);
    if (create) jhlp::set_value(o, "create", create->to_json(a), a);
    jval arr(rapidjson::kArrayType);
    for (const auto& c : changes) arr.PushBack(change_to_json(c, a), a);
    jhlp::set_value(o, "changes", std::move(arr), a);
    return o;
}

ChangeSet ChangeSet::from_json(const jval& j) {
    if (!j.IsObject()) THROW("Change set must be a JSON object");
    ChangeSet cs;
    cs.table = jhlp::get<std::string>(j, "table");
    if (j.HasMember("create") && j["create"].IsObject()) {
        cs.create = SchemaSnapshot::from_json(j["create"]);
    }
    if (j.HasMember("changes")) {
        const jval& arr = j["changes"];
        if (!arr.IsArray()) THROW("Change set changes must be an array");
        for (const auto& c : arr.GetArray()) cs.changes.push_back(change_from_json(c));
    }
    return cs;
}
