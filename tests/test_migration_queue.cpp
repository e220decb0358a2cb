#include <catch2/catch.hpp>
#include <fstream>
#include "lib.hpp"
#include "migration_queue.hpp"
#include "model.hpp"
#include "schemaupdate.hpp"
#include "tmpdir.hpp"

namespace fs = std::filesystem;

namespace {

    // a distinct declaration per call so every write has something to queue
    SchemaSnapshot version(int n) {
        ModelDecl m("M");
        m.field("id", "SERIAL");
        for (int i = 1; i < n; ++i) m.field("c" + std::to_string(i), "int");
        return m.describe();
    }

    std::optional<MigrationUnit> write_next(MigrationQueue& q, const std::string& model, int n) {
        auto latest = q.latest(model);
        auto target = version(n);
        const SchemaSnapshot* base = latest ? &latest->snapshot : nullptr;
        return q.write(model, plan_changes(base, target), target);
    }

    size_t count_files(const fs::path& dir) {
        if (!fs::is_directory(dir)) return 0;
        size_t n = 0;
        for (const auto& e : fs::directory_iterator(dir)) n += e.is_regular_file();
        return n;
    }

}

TEST_CASE("Units are written with increasing sequences", "[queue]") {
    TempDir tmp;
    SnapshotStore store(tmp.path);
    MigrationQueue q(store, 4);

    auto u1 = write_next(q, "M", 1);
    REQUIRE(u1.has_value());
    REQUIRE(u1->sequence == 1);
    REQUIRE(u1->state == UnitState::Queued);
    REQUIRE(u1->change_set.is_create());
    REQUIRE(u1->sql.size() == 1);
    REQUIRE(u1->path.filename().string().rfind("M_0001_", 0) == 0);
    REQUIRE(u1->path.extension() == ".json");

    auto u2 = write_next(q, "M", 2);
    REQUIRE(u2->sequence == 2);
    REQUIRE(u2->sql == std::vector<std::string> { "ALTER TABLE \"M\" ADD COLUMN \"c1\" int" });

    auto units = q.list("M");
    REQUIRE(units.size() == 2);
    REQUIRE(units[0].sequence == 1);
    REQUIRE(units[1].sequence == 2);
    REQUIRE(units[1].snapshot == version(2));
    REQUIRE(q.unit_name("M", 2) == "M_0002");
    REQUIRE(q.models() == std::vector<std::string> { "M" });
}

TEST_CASE("Empty change set writes nothing", "[queue]") {
    TempDir tmp;
    SnapshotStore store(tmp.path);
    MigrationQueue q(store);

    auto target = version(1);
    ChangeSet empty;
    empty.table = "M";
    REQUIRE_FALSE(q.write("M", empty, target).has_value());
    REQUIRE(count_files(q.queue_dir("M")) == 0);
}

TEST_CASE("Generation error leaves the queue untouched", "[queue][error]") {
    TempDir tmp;
    SnapshotStore store(tmp.path);
    MigrationQueue q(store);

    ChangeSet bad;
    bad.table = "M";
    bad.changes = { alter_field("c1", {}) };
    REQUIRE_THROWS_AS(q.write("M", bad, version(2)), GenerationError);
    REQUIRE_FALSE(fs::exists(q.model_dir("M") / SEQUENCE_FILE));
    REQUIRE(count_files(q.queue_dir("M")) == 0);
    REQUIRE(q.next_sequence("M") == 1);
}

TEST_CASE("Deleted sequences are never reused", "[queue][delete]") {
    TempDir tmp;
    SnapshotStore store(tmp.path);
    MigrationQueue q(store);

    write_next(q, "M", 1);
    write_next(q, "M", 2);
    REQUIRE(q.delete_range("M", 2, 2) == 1);

    auto units = q.list("M");
    REQUIRE(units.size() == 1);
    REQUIRE(count_files(q.trash_dir("M")) == 1);

    auto u3 = write_next(q, "M", 3);
    REQUIRE(u3->sequence == 3);

    // the trash alone keeps the number taken
    fs::remove(q.model_dir("M") / SEQUENCE_FILE);
    REQUIRE(q.next_sequence("M") == 4);
}

TEST_CASE("Delete range validation", "[queue][delete][error]") {
    TempDir tmp;
    SnapshotStore store(tmp.path);
    MigrationQueue q(store);

    auto u1 = write_next(q, "M", 1);
    write_next(q, "M", 2);

    REQUIRE_THROWS_AS(q.delete_range("M", 0, 1), MigrationError);
    REQUIRE_THROWS_AS(q.delete_range("M", 2, 1), MigrationError);

    q.mark(*u1, UnitState::Applied);
    REQUIRE_THROWS_AS(q.delete_range("M", 1, 2), MigrationError);
    // nothing moved
    REQUIRE(q.list("M").size() == 2);

    REQUIRE(q.delete_range("M", 5, 9) == 0);
}

TEST_CASE("Units the store already recorded as applied can not be deleted", "[queue][delete][error]") {
    TempDir tmp;
    SnapshotStore store(tmp.path);
    MigrationQueue q(store);

    auto u1 = write_next(q, "M", 1);
    auto u2 = write_next(q, "M", 2);
    auto u3 = write_next(q, "M", 3);
    q.mark(*u1, UnitState::Applied);
    q.mark(*u2, UnitState::Applied);
    // unit 3 committed but its file was never marked
    store.save("M", version(3), 3);
    REQUIRE(q.list("M")[2].state == UnitState::Queued);

    REQUIRE_THROWS_WITH(q.delete_range("M", 3, 3), Catch::Contains("already applied"));
    REQUIRE_THROWS_AS(q.delete_range("M", 2, 4), MigrationError);
    REQUIRE(q.list("M").size() == 3);
    REQUIRE(count_files(q.trash_dir("M")) == 0);

    write_next(q, "M", 4);
    REQUIRE(q.delete_range("M", 4, 4) == 1);
}

TEST_CASE("Unit state changes are persisted", "[queue]") {
    TempDir tmp;
    SnapshotStore store(tmp.path);
    MigrationQueue q(store);

    auto u = write_next(q, "M", 1);
    q.mark(*u, UnitState::Failed, "boom");
    auto reread = MigrationQueue::load(u->path);
    REQUIRE(reread.state == UnitState::Failed);
    REQUIRE(reread.error == "boom");

    q.mark(*u, UnitState::Applied);
    reread = MigrationQueue::load(u->path);
    REQUIRE(reread.applied());
    REQUIRE(reread.error.empty());
    REQUIRE_FALSE(reread.applied_at.empty());

    REQUIRE_THROWS(q.mark(*u, UnitState::Queued));
}

TEST_CASE("Hooks edited in the unit file are read back", "[queue][hooks]") {
    TempDir tmp;
    SnapshotStore store(tmp.path);
    MigrationQueue q(store);

    auto u = write_next(q, "M", 1);
    u->run_before = { "SELECT 1" };
    u->run_after = { "UPDATE \"M\" SET id = id" };
    MigrationQueue::save(*u);

    auto units = q.list("M");
    REQUIRE(units[0].run_before == std::vector<std::string> { "SELECT 1" });
    REQUIRE(units[0].run_after == std::vector<std::string> { "UPDATE \"M\" SET id = id" });
    REQUIRE(units[0].change_set == u->change_set);
}

TEST_CASE("Inconsistent queue directories are rejected", "[queue][error]") {
    TempDir tmp;
    SnapshotStore store(tmp.path);
    MigrationQueue q(store);

    auto u = write_next(q, "M", 1);

    SECTION("unit of another model") {
        auto copy = *u;
        copy.model = "Other";
        copy.sequence = 2;
        copy.path = q.queue_dir("M") / "stray.json";
        MigrationQueue::save(copy);
        REQUIRE_THROWS_AS(q.list("M"), HistoryConsistencyError);
    }
    SECTION("duplicate sequence") {
        fs::copy_file(u->path, q.queue_dir("M") / "M_dup.json");
        REQUIRE_THROWS_AS(q.list("M"), HistoryConsistencyError);
    }
}
