#include "migration_queue.hpp"
#include <algorithm>
#include <fstream>
#include "ddl_visitor.hpp"
#include "lib.hpp"

namespace fs = std::filesystem;

std::string unit_state_name(UnitState state) {
    switch (state) {
        case UnitState::Queued: return "queued";
        case UnitState::Applied: return "applied";
        case UnitState::Failed: return "failed";
    }
    THROW("Unknown unit state");
}

UnitState unit_state(const std::string& name) {
    if (name == "queued") return UnitState::Queued;
    if (name == "applied") return UnitState::Applied;
    if (name == "failed") return UnitState::Failed;
    THROW("Unknown unit state: %s", name.c_str());
}

/* ---------- MigrationUnit ---------- */

jval MigrationUnit::to_json(jdaloc& a) const {
    jval j(rapidjson::kObjectType);
    jhlp::set(j, "model", model, a);
    jhlp::set(j, "sequence", sequence, a);
    jhlp::set(j, "created_at", created_at, a);
    if (!applied_at.empty()) jhlp::set(j, "applied_at", applied_at, a);
    jhlp::set(j, "state", unit_state_name(state), a);
    if (!error.empty()) jhlp::set(j, "error", error, a);
    jhlp::set_value(j, "change_set", change_set.to_json(a), a);
    jhlp::set(j, "sql", sql, a);
    jhlp::set_value(j, "snapshot", snapshot.to_json(a), a);

    jval hooks(rapidjson::kObjectType);
    jhlp::set(hooks, "run_before", run_before, a);
    jhlp::set(hooks, "run_after", run_after, a);
    jhlp::set_value(j, "hooks", std::move(hooks), a);
    return j;
}

MigrationUnit MigrationUnit::from_json(const jval& j) {
    if (!j.IsObject()) THROW("Migration unit must be a JSON object");
    MigrationUnit u;
    u.model = jhlp::get<std::string>(j, "model");
    u.sequence = jhlp::get<int>(j, "sequence", 0);
    if (u.model.empty() || u.sequence < 1) THROW("Migration unit without model or sequence");
    u.created_at = jhlp::get<std::string>(j, "created_at");
    u.applied_at = jhlp::get<std::string>(j, "applied_at");
    u.state = unit_state(jhlp::get<std::string>(j, "state", "queued"));
    u.error = jhlp::get<std::string>(j, "error");
    if (!j.HasMember("change_set") || !j.HasMember("snapshot"))
        THROW("Migration unit %s #%d is missing change_set or snapshot", u.model.c_str(), u.sequence);
    u.change_set = ChangeSet::from_json(j["change_set"]);
    u.sql = jhlp::get_strings(j, "sql");
    u.snapshot = SchemaSnapshot::from_json(j["snapshot"]);
    if (j.HasMember("hooks")) {
        const jval& hooks = j["hooks"];
        u.run_before = jhlp::get_strings(hooks, "run_before");
        u.run_after = jhlp::get_strings(hooks, "run_after");
    }
    return u;
}

/* ---------- MigrationQueue ---------- */

MigrationQueue::MigrationQueue(const SnapshotStore& store, int index_length)
    : store_(store), index_length_(index_length) { }

MigrationUnit MigrationQueue::load(const fs::path& file) {
    jdoc doc;
    jhlp::load_file(file.string(), doc);
    MigrationUnit u = MigrationUnit::from_json(doc);
    u.path = file;
    return u;
}

void MigrationQueue::save(const MigrationUnit& unit) {
    if (unit.path.empty()) THROW("Migration unit %s #%d has no file", unit.model.c_str(), unit.sequence);
    jdoc doc;
    jval j = unit.to_json(doc.GetAllocator());
    jhlp::write_file(unit.path, j);
}

std::vector<MigrationUnit> MigrationQueue::read_dir(const fs::path& dir) {
    std::vector<MigrationUnit> units;
    if (!fs::is_directory(dir)) return units;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        units.push_back(load(entry.path()));
    }
    std::sort(units.begin(), units.end(),
        [](const MigrationUnit& l, const MigrationUnit& r) { return l.sequence < r.sequence; });
    return units;
}

std::vector<MigrationUnit> MigrationQueue::list(const std::string& model) const {
    auto units = read_dir(queue_dir(model));
    for (size_t i = 0; i < units.size(); ++i) {
        if (units[i].model != model)
            THROW_AS(HistoryConsistencyError, "Unit %s belongs to model '%s', not '%s'",
                units[i].path.c_str(), units[i].model.c_str(), model.c_str());
        if (i > 0 && units[i].sequence == units[i - 1].sequence)
            THROW_AS(HistoryConsistencyError, "Model '%s' has two units with sequence %d",
                model.c_str(), units[i].sequence);
    }
    return units;
}

std::optional<MigrationUnit> MigrationQueue::latest(const std::string& model) const {
    auto units = list(model);
    if (units.empty()) return std::nullopt;
    return units.back();
}

int MigrationQueue::high_water_mark(const std::string& model) const {
    fs::path file = model_dir(model) / SEQUENCE_FILE;
    if (!fs::exists(file)) return 0;
    std::ifstream in(file);
    int value = 0;
    if (!(in >> value)) THROW("Invalid sequence file: %s", file.c_str());
    return value;
}

void MigrationQueue::set_high_water_mark(const std::string& model, int sequence) const {
    if (sequence <= high_water_mark(model)) return;
    fs::path file = model_dir(model) / SEQUENCE_FILE;
    fs::path tmp = file;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << sequence << '\n';
        if (!out) THROW("Failed to write: %s", tmp.c_str());
    }
    fs::rename(tmp, file);
}

int MigrationQueue::next_sequence(const std::string& model) const {
    int top = high_water_mark(model);
    for (const auto& u : read_dir(queue_dir(model))) top = std::max(top, u.sequence);
    for (const auto& u : read_dir(trash_dir(model))) top = std::max(top, u.sequence);
    if (auto rec = store_.load(model)) top = std::max(top, rec->last_applied_sequence);
    return top + 1;
}

std::optional<MigrationUnit> MigrationQueue::write(const std::string& model, const ChangeSet& cs, const SchemaSnapshot& target) {
    if (cs.empty()) {
        SPDLOG_DEBUG("No changes for model '{}', nothing queued", model);
        return std::nullopt;
    }

    MigrationUnit u;
    u.model = model;
    u.change_set = cs;
    u.snapshot = target;
    // rendered before anything touches the disk
    u.sql = generate_sql(cs.table, cs);
    u.sequence = next_sequence(model);
    u.created_at = iso_timestamp();
    u.state = UnitState::Queued;

    fs::create_directories(queue_dir(model));
    u.path = queue_dir(model) / (unit_name(model, u.sequence) + "_" + file_timestamp() + ".json");
    save(u);
    set_high_water_mark(model, u.sequence);

    SPDLOG_INFO("Migration queued: {}", unit_name(model, u.sequence));
    for (const auto& s : u.sql) SPDLOG_DEBUG("  {}", s);
    return u;
}

void MigrationQueue::mark(MigrationUnit& unit, UnitState state, const std::string& error) {
    if (unit.applied() && state != UnitState::Applied)
        THROW("Migration %s #%d is applied and can not change state", unit.model.c_str(), unit.sequence);
    unit.state = state;
    unit.error = state == UnitState::Failed ? error : "";
    if (state == UnitState::Applied) unit.applied_at = iso_timestamp();
    save(unit);
}

int MigrationQueue::delete_range(const std::string& model, int start, int end) {
    if (start < 1 || start > end)
        THROW_AS(MigrationError, "Invalid sequence range %d..%d: expected 1 <= start <= end", start, end);

    // the store is ahead of the unit files when a run stopped between save and mark
    const int last_applied = [&] {
        auto rec = store_.load(model);
        return rec ? rec->last_applied_sequence : 0;
    }();

    std::vector<MigrationUnit> doomed;
    for (auto& u : list(model)) {
        if (u.sequence < start || u.sequence > end) continue;
        if (u.applied() || u.sequence <= last_applied)
            THROW_AS(MigrationError, "Migration %s #%d is already applied and can not be deleted",
                model.c_str(), u.sequence);
        doomed.push_back(std::move(u));
    }
    if (doomed.empty()) {
        SPDLOG_WARN("No queued migration of '{}' in range {}..{}", model, start, end);
        return 0;
    }

    // numbers of deleted units stay taken
    set_high_water_mark(model, next_sequence(model) - 1);
    fs::create_directories(trash_dir(model));
    for (const auto& u : doomed) {
        fs::rename(u.path, trash_dir(model) / u.path.filename());
        SPDLOG_INFO("Migration deleted: {}", unit_name(model, u.sequence));
    }
    return static_cast<int>(doomed.size());
}

std::vector<std::string> MigrationQueue::models() const {
    std::vector<std::string> out;
    if (!fs::is_directory(store_.base_dir())) return out;
    for (const auto& entry : fs::directory_iterator(store_.base_dir())) {
        if (entry.is_directory()) out.push_back(entry.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string MigrationQueue::unit_name(const std::string& model, int sequence) const {
    return model + "_" + zero_pad(sequence, index_length_);
}
