#include "schemaupdate.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include "lib.hpp"

namespace {

    std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
        return s;
    }

    bool has_not_null(const std::string& fragment) {
        return upper(fragment).find("NOT NULL") != std::string::npos;
    }

    bool starts_with(const std::string& s, const std::string& prefix) {
        return upper(s).rfind(prefix, 0) == 0;
    }

    bool any_starts_with(const std::vector<std::string>& ops, const std::string& prefix) {
        return std::any_of(ops.begin(), ops.end(), [&](const std::string& op) { return starts_with(op, prefix); });
    }

    void push_unique(std::vector<std::string>& ops, const std::string& op) {
        if (std::find(ops.begin(), ops.end(), op) == ops.end()) ops.push_back(op);
    }

}

std::vector<std::string> alter_ops_between(const FieldSpec& of, const FieldSpec& nf) {
    std::vector<std::string> ops;

    if (of.sql_type != nf.sql_type) {
        push_unique(ops, "TYPE " + nf.sql_type);
    }

    // nullability declared on add is carried over when it changes
    bool old_nn = has_not_null(of.on_add) || any_starts_with(of.alter_ops, "SET NOT NULL");
    bool new_nn = has_not_null(nf.on_add) || any_starts_with(nf.alter_ops, "SET NOT NULL");
    if (has_not_null(nf.on_add) && !old_nn) push_unique(ops, "SET NOT NULL");

    if (of.alter_ops != nf.alter_ops) {
        for (const auto& op : nf.alter_ops) {
            if (std::find(of.alter_ops.begin(), of.alter_ops.end(), op) == of.alter_ops.end())
                push_unique(ops, op);
        }
        // removed fragments with a natural inverse
        if (any_starts_with(of.alter_ops, "SET DEFAULT") && !any_starts_with(nf.alter_ops, "SET DEFAULT"))
            push_unique(ops, "DROP DEFAULT");
    }
    if (old_nn && !new_nn) push_unique(ops, "DROP NOT NULL");

    return ops;
}

SchemaUpdate::SchemaUpdate(const SchemaSnapshot* old_schema, const SchemaSnapshot& new_schema)
    : old_schema_(old_schema), new_schema_(new_schema) {}

ChangeSet SchemaUpdate::diff() const {
    ChangeSet cs;
    cs.table = new_schema_.table;

    if (!old_schema_) {
        cs.create = new_schema_;
        return cs;
    }
    if (old_schema_->table != new_schema_.table) {
        THROW_AS(DiffError, "Can not diff table '%s' against table '%s'",
            old_schema_->table.c_str(), new_schema_.table.c_str());
    }

    // name ordered union of both field sets
    std::map<std::string, std::pair<const FieldSpec*, const FieldSpec*>> fields;
    for (const auto& f : old_schema_->fields) fields[f.name].first = &f;
    for (const auto& f : new_schema_.fields) fields[f.name].second = &f;

    for (const auto& [name, pair] : fields) {
        const auto [of, nf] = pair;
        if (!of) {
            cs.changes.push_back(add_field(*nf));
            if (!nf->alter_ops.empty()) cs.changes.push_back(alter_field(name, nf->alter_ops));
            for (const auto& idx : nf->indexes) {
                if (!idx.remove) cs.changes.push_back(add_index(name, idx));
            }
        } else if (!nf) {
            cs.changes.push_back(drop_field(*of));
        } else if (!(*of == *nf)) {
            diff_field(*of, *nf, cs.changes);
        }
    }

    diff_groups(cs.changes);
    return cs;
}

void SchemaUpdate::diff_field(const FieldSpec& of, const FieldSpec& nf, std::vector<Change>& out) const {
    auto ops = alter_ops_between(of, nf);
    if (!ops.empty()) out.push_back(alter_field(nf.name, std::move(ops)));
    diff_indexes(of, nf, out);
}

void SchemaUpdate::diff_indexes(const FieldSpec& of, const FieldSpec& nf, std::vector<Change>& out) const {
    auto active = [](const FieldSpec& f, const IndexSpec& idx) {
        return std::any_of(f.indexes.begin(), f.indexes.end(),
            [&](const IndexSpec& i) { return !i.remove && i.key() == idx.key(); });
    };

    std::set<std::string> dropped; // kinds already dropped in this diff
    for (const auto& idx : of.indexes) {
        if (idx.remove || active(nf, idx)) continue;
        if (dropped.insert(idx.kind).second) out.push_back(drop_index(nf.name, idx));
    }
    // removal marker: dropped unless the baseline already recorded the same marker
    // and has no live index of that kind (the drop already ran)
    for (const auto& idx : nf.indexes) {
        if (!idx.remove) continue;
        bool already = of.find_index(idx.kind, true) && !of.find_index(idx.kind, false);
        if (already) continue;
        if (dropped.insert(idx.kind).second) out.push_back(drop_index(nf.name, idx));
    }
    for (const auto& idx : nf.indexes) {
        if (idx.remove || active(of, idx)) continue;
        out.push_back(add_index(nf.name, idx));
    }
}

void SchemaUpdate::diff_groups(std::vector<Change>& out) const {
    std::map<std::string, std::pair<std::optional<UniqueGroup>, std::optional<UniqueGroup>>> groups;
    for (auto& g : old_schema_->effective_unique_groups()) groups[g.name].first = g;
    for (auto& g : new_schema_.effective_unique_groups()) groups[g.name].second = g;

    for (const auto& [name, pair] : groups) {
        const auto& [og, ng] = pair;
        if (!og) {
            out.push_back(add_unique_group(*ng));
        } else if (!ng) {
            out.push_back(drop_unique_group(name));
        } else if (og->fields != ng->fields) {
            out.push_back(modify_unique_group(*ng));
        }
    }
}

ChangeSet diff(const SchemaSnapshot* old_schema, const SchemaSnapshot& new_schema) {
    return SchemaUpdate(old_schema, new_schema).diff();
}

ChangeSet plan_changes(const SchemaSnapshot* baseline, const SchemaSnapshot& declared) {
    if (baseline && baseline->table != declared.table) {
        ChangeSet cs = diff(nullptr, declared);
        cs.changes.push_back(drop_table(baseline->table));
        return cs;
    }
    return diff(baseline, declared);
}
