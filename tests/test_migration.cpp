#include <catch2/catch.hpp>
#include "lib.hpp"
#include "migration.hpp"
#include "tmpdir.hpp"

namespace {

    ModelRegistry registry(bool with_year = false) {
        ModelRegistry reg;
        ModelDecl book("Book");
        book.table("book").field("id", "INTEGER").field("title", "varchar(200)");
        if (with_year) book.field("year", "int");
        reg.add(book);
        reg.add(ModelDecl("Author").field("id", "INTEGER").field("name", "text"));
        reg.add(ModelDecl("Base").abstract().field("id", "INTEGER"));
        reg.add(ModelDecl("BookView").proxy().table("book").field("id", "INTEGER"));
        return reg;
    }

    Migration::MakeOptions yes(std::vector<std::string> models = {}) {
        Migration::MakeOptions opts;
        opts.yes = true;
        opts.models = std::move(models);
        return opts;
    }

    std::vector<std::string> columns(SQLConnection& conn, const std::string& table) {
        std::vector<std::string> out;
        jdoc rows = conn.fetch("SELECT name FROM pragma_table_info($1)", { table });
        for (const auto& row : rows.GetArray()) out.push_back(jhlp::get<std::string>(row, "name"));
        return out;
    }

}

TEST_CASE("Make then run against SQLite", "[migration][sqlite]") {
    TempDir tmp;
    DbPool db(1, tmp.str("db.sqlite"), make_sqlite_connection);
    auto reg = registry();
    Migration mig(reg, tmp.path / "migrations", &db);

    auto units = mig.make_migrations(yes());
    REQUIRE(units.size() == 2);
    REQUIRE(units[0].model == "Book");
    REQUIRE(units[1].model == "Author");
    REQUIRE(units[0].sequence == 1);

    // nothing new declared: nothing new queued
    REQUIRE(mig.make_migrations(yes()).empty());

    auto report = mig.run();
    REQUIRE(report.ok());
    REQUIRE(report.applied_count() == 2);
    {
        auto lease = pool::acquire_or_throw(db, pool::DbIntent::Read);
        REQUIRE(columns(lease.conn(), "book") == std::vector<std::string> { "id", "title" });
    }

    SECTION("a later change is queued and applied on top") {
        auto reg2 = registry(true);
        Migration mig2(reg2, tmp.path / "migrations", &db);
        auto next = mig2.make_migrations(yes());
        REQUIRE(next.size() == 1);
        REQUIRE(next[0].sequence == 2);
        REQUIRE(next[0].sql == std::vector<std::string> { "ALTER TABLE \"book\" ADD COLUMN \"year\" int" });

        REQUIRE(mig2.run().applied_count() == 1);
        auto lease = pool::acquire_or_throw(db, pool::DbIntent::Read);
        REQUIRE(columns(lease.conn(), "book") == std::vector<std::string> { "id", "title", "year" });
        REQUIRE(mig2.store().load("Book")->last_applied_sequence == 2);
    }
    SECTION("running again applies nothing") {
        REQUIRE(mig.run().applied_count() == 0);
    }
}

TEST_CASE("Declined change sets are not queued", "[migration][confirm]") {
    TempDir tmp;
    auto reg = registry();
    Migration mig(reg, tmp.path);

    std::vector<std::string> asked;
    Migration::MakeOptions opts;
    opts.confirm = [&](const std::string& model, const ChangeSet& cs, const std::vector<std::string>& sql) {
        asked.push_back(model);
        REQUIRE(cs.is_create());
        REQUIRE_FALSE(sql.empty());
        return model == "Author";
    };

    auto units = mig.make_migrations(opts);
    REQUIRE(asked == std::vector<std::string> { "Book", "Author" });
    REQUIRE(units.size() == 1);
    REQUIRE(units[0].model == "Author");
    REQUIRE(mig.queue().list("Book").empty());
    REQUIRE_FALSE(mig.baseline("Book").has_value());
    REQUIRE(mig.baseline("Author") == reg.get("Author").describe());
}

TEST_CASE("One confirmation covers the whole change set of a model", "[migration][confirm]") {
    TempDir tmp;
    auto reg = registry();
    Migration(reg, tmp.path).make_migrations(yes({ "Book" }));

    ModelRegistry reg2;
    reg2.add(ModelDecl("Book").table("book").field("id", "INTEGER").field("title", "varchar(200)")
            .field("year", "int").field("isbn", "text"));
    Migration mig(reg2, tmp.path);

    int asked = 0;
    Migration::MakeOptions opts;
    opts.confirm = [&](const std::string&, const ChangeSet& cs, const std::vector<std::string>& sql) {
        ++asked;
        REQUIRE(cs.changes.size() == 2);
        REQUIRE(cs.changes[0].kind == ChangeKind::AddField);
        REQUIRE(cs.changes[1].kind == ChangeKind::AddField);
        REQUIRE(sql.size() == 2);
        return true;
    };
    auto units = mig.make_migrations(opts);
    REQUIRE(asked == 1);
    REQUIRE(units.size() == 1);
    REQUIRE(units[0].change_set.changes.size() == 2);
}

TEST_CASE("Abstract and proxy models", "[migration][error]") {
    TempDir tmp;
    auto reg = registry();
    Migration mig(reg, tmp.path);

    auto all = mig.select({});
    REQUIRE(all.size() == 2);

    REQUIRE_THROWS_AS(mig.select({ "Base" }), ModelNotAllowedError);
    REQUIRE_THROWS_WITH(mig.select({ "Base" }), Catch::Contains("Abstract model (Base) can not be passed for migration"));
    REQUIRE_THROWS_WITH(mig.make_migrations(yes({ "BookView" })), Catch::Contains("Proxy model (BookView)"));
    REQUIRE(mig.queue().models().empty());

    REQUIRE(mig.make_migrations(yes({ "Author" })).size() == 1);
    REQUIRE(mig.queue().list("Book").empty());
}

TEST_CASE("An invalid declaration stops make before anything is written", "[migration][error]") {
    TempDir tmp;
    ModelRegistry reg;
    reg.add(ModelDecl("Author").field("id", "INTEGER"));
    // 'email' was removed but the group still lists it
    reg.add(ModelDecl("User").field("id", "INTEGER").unique_group("ie", { "id", "email" }));
    Migration mig(reg, tmp.path);

    REQUIRE_THROWS_AS(mig.make_migrations(yes()), DeclarationError);
    REQUIRE(mig.queue().list("Author").empty());
}

TEST_CASE("Deleted migrations keep their numbers", "[migration][delete]") {
    TempDir tmp;
    auto reg1 = registry();
    Migration first(reg1, tmp.path);
    first.make_migrations(yes({ "Book" }));

    auto reg2 = registry(true);
    Migration mig(reg2, tmp.path);
    REQUIRE(mig.make_migrations(yes({ "Book" }))[0].sequence == 2);

    REQUIRE_THROWS_AS(mig.delete_migration_files(3, 2), MigrationError);
    REQUIRE(mig.delete_migration_files(2, 2, { "Book" }) == 1);

    auto again = mig.make_migrations(yes({ "Book" }));
    REQUIRE(again.size() == 1);
    REQUIRE(again[0].sequence == 3);
    REQUIRE(again[0].change_set.changes.size() == 1);

    auto st = mig.status({ "Book" });
    REQUIRE(st.size() == 1);
    REQUIRE(st[0].first == "Book");
    REQUIRE(st[0].second.size() == 2);
    REQUIRE(st[0].second[0].sequence == 1);
    REQUIRE(st[0].second[1].sequence == 3);
}

TEST_CASE("A failing model surfaces as ApplyError after the others ran", "[migration][sqlite][failure]") {
    TempDir tmp;
    DbPool db(1, tmp.str("db.sqlite"), make_sqlite_connection);
    auto reg = registry();
    Migration mig(reg, tmp.path / "migrations", &db);

    auto units = mig.make_migrations(yes());
    auto& book = units[0];
    book.run_before = { "INSERT INTO missing VALUES (1)" };
    MigrationQueue::save(book);

    try {
        mig.run();
        FAIL("no ApplyError");
    } catch (const ApplyError& e) {
        REQUIRE(e.model() == "Book");
        REQUIRE(e.sequence() == 1);
        REQUIRE(e.db_error().find("missing") != std::string::npos);
    }
    REQUIRE(mig.store().load("Author")->last_applied_sequence == 1);
    REQUIRE_FALSE(mig.store().load("Book").has_value());

    auto st = mig.status({ "Book" });
    REQUIRE(st[0].second[0].state == UnitState::Failed);
}

TEST_CASE("Run without a database", "[migration][error]") {
    TempDir tmp;
    auto reg = registry();
    Migration mig(reg, tmp.path);
    REQUIRE_THROWS(mig.runner());
    REQUIRE_THROWS(mig.run());
}

TEST_CASE("Baseline follows the store when it is ahead of the unit files", "[migration][baseline]") {
    TempDir tmp;
    auto reg = registry();
    Migration mig(reg, tmp.path);
    auto first = mig.make_migrations(yes({ "Book" }));
    REQUIRE(first.size() == 1);
    REQUIRE(mig.baseline("Book") == first[0].snapshot);

    // a unit newer than any file was applied: its trashed file is gone
    auto reg2 = registry(true);
    auto applied = reg2.get("Book").describe();
    mig.store().save("Book", applied, 2);
    REQUIRE(mig.baseline("Book") == applied);

    Migration mig2(reg2, tmp.path);
    REQUIRE(mig2.make_migrations(yes({ "Book" })).empty());
}
