#include "migration.hpp"
#include "ddl_visitor.hpp"
#include "lib.hpp"
#include "model_lock.hpp"
#include "schemaupdate.hpp"

Migration::Migration(const ModelRegistry& registry, std::filesystem::path migration_dir,
    pool::IDbPool* db, int index_length)
    : registry_(registry)
    , store_(std::move(migration_dir))
    , queue_(store_, index_length) {
    if (db) runner_ = std::make_unique<MigrationRunner>(*db, store_, queue_);
}

MigrationRunner& Migration::runner() {
    if (!runner_) THROW("No database configured: migrations can not be applied");
    return *runner_;
}

std::vector<const ModelDecl*> Migration::select(const std::vector<std::string>& names) const {
    std::vector<const ModelDecl*> out;
    if (names.empty()) {
        for (const auto& m : registry_.all()) {
            if (m->is_abstract() || m->is_proxy()) {
                SPDLOG_DEBUG("Skipping {} model {}", m->is_abstract() ? "abstract" : "proxy", m->name());
                continue;
            }
            out.push_back(m.get());
        }
        return out;
    }
    for (const auto& name : names) {
        const ModelDecl& m = registry_.get(name);
        if (m.is_abstract())
            THROW_AS(ModelNotAllowedError, "Abstract model (%s) can not be passed for migration", name.c_str());
        if (m.is_proxy())
            THROW_AS(ModelNotAllowedError, "Proxy model (%s) can not be passed for migration. Do migration with the non-proxy version.", name.c_str());
        out.push_back(&m);
    }
    return out;
}

std::optional<SchemaSnapshot> Migration::baseline(const std::string& model) const {
    auto last = queue_.latest(model);
    auto rec = store_.load(model);
    // an applied snapshot newer than every unit file wins
    if (rec && (!last || rec->last_applied_sequence > last->sequence)) return rec->snapshot;
    if (last) return last->snapshot;
    return std::nullopt;
}

std::vector<MigrationUnit> Migration::make_migrations(const MakeOptions& opts) {
    auto models = select(opts.models);

    // every declaration is valid before anything is written
    std::vector<SchemaSnapshot> declared;
    for (const auto* m : models) declared.push_back(m->describe());

    std::vector<MigrationUnit> written;
    for (size_t i = 0; i < models.size(); ++i) {
        const std::string& name = models[i]->name();
        SPDLOG_INFO("=> Making migrations for model {}", name);

        ModelLock lock(queue_.model_dir(name));
        auto base = baseline(name);
        ChangeSet cs = plan_changes(base ? &*base : nullptr, declared[i]);
        if (cs.empty()) {
            SPDLOG_INFO("   No changes detected");
            continue;
        }

        auto sql = generate_sql(cs.table, cs);
        if (cs.is_create()) SPDLOG_INFO("   Create table {}", cs.table);
        for (const auto& c : cs.changes) SPDLOG_INFO("   {}", c.describe());

        if (!opts.yes && opts.confirm && !opts.confirm(name, cs, sql)) {
            SPDLOG_INFO("   Skipped, nothing queued for {}", name);
            continue;
        }
        if (auto unit = queue_.write(name, cs, declared[i])) written.push_back(std::move(*unit));
    }
    return written;
}

RunReport Migration::run(const std::vector<std::string>& models) {
    auto selected = select(models);
    RunReport report = runner().apply_all(selected);
    SPDLOG_INFO("{} migration(s) applied", report.applied_count());
    for (const auto& m : report.models) {
        if (!m.ok()) throw ApplyError(m.model, m.failed, m.error);
    }
    return report;
}

int Migration::delete_migration_files(int start, int end, const std::vector<std::string>& models) {
    if (start < 1 || start > end)
        THROW_AS(MigrationError, "Invalid start (%d) and end index (%d)", start, end);
    int total = 0;
    for (const auto* m : select(models)) {
        SPDLOG_INFO("=> Deleting migration files for model {}", m->name());
        ModelLock lock(queue_.model_dir(m->name()));
        total += queue_.delete_range(m->name(), start, end);
    }
    return total;
}

std::vector<std::pair<std::string, std::vector<MigrationUnit>>> Migration::status(const std::vector<std::string>& models) const {
    std::vector<std::pair<std::string, std::vector<MigrationUnit>>> out;
    for (const auto* m : select(models)) out.emplace_back(m->name(), queue_.list(m->name()));
    return out;
}
