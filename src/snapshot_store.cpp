#include "snapshot_store.hpp"
#include "lib.hpp"

namespace fs = std::filesystem;

SnapshotStore::SnapshotStore(fs::path base_dir) : base_(std::move(base_dir)) { }

std::optional<AppliedRecord> SnapshotStore::load(const std::string& model) const {
    fs::path file = model_dir(model) / APPLIED_FILE;
    if (!fs::exists(file)) return std::nullopt;

    jdoc doc;
    jhlp::load_file(file.string(), doc);
    if (!doc.IsObject() || !doc.HasMember("snapshot"))
        THROW("Invalid snapshot record for model '%s': %s", model.c_str(), file.c_str());

    AppliedRecord rec;
    rec.snapshot = SchemaSnapshot::from_json(doc["snapshot"]);
    rec.last_applied_sequence = jhlp::get<int>(doc, "last_applied_sequence", 0);
    if (rec.last_applied_sequence < 1)
        THROW("Snapshot record for model '%s' has no applied sequence", model.c_str());
    return rec;
}

void SnapshotStore::save(const std::string& model, const SchemaSnapshot& snapshot, int sequence) {
    fs::path dir = model_dir(model);
    fs::create_directories(dir);

    jdoc doc(rapidjson::kObjectType);
    auto& a = doc.GetAllocator();
    jhlp::set(doc, "model", model, a);
    jhlp::set(doc, "last_applied_sequence", sequence, a);
    jhlp::set(doc, "saved_at", iso_timestamp(), a);
    jhlp::set_value(doc, "snapshot", snapshot.to_json(a), a);

    jhlp::write_file(dir / APPLIED_FILE, doc);
    SPDLOG_DEBUG("Snapshot of '{}' saved at sequence {}", model, sequence);
}
