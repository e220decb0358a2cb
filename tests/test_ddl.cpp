#include <catch2/catch.hpp>
#include "lib.hpp"
#include "ddl_visitor.hpp"
#include "model.hpp"
#include "schemaupdate.hpp"

namespace {

    ModelDecl model_m() {
        return ModelDecl("M")
            .field("id", "SERIAL")
            .field("name", "varchar(255)");
    }

}

TEST_CASE("New model renders a single CREATE TABLE", "[ddl][create]") {
    auto s = model_m().describe();
    auto cs = diff(nullptr, s);
    auto sql = generate_sql("M", cs);

    REQUIRE(sql.size() == 1);
    REQUIRE(sql[0] ==
        "CREATE TABLE \"M\" (\n"
        "    \"id\" SERIAL,\n"
        "    \"name\" varchar(255)\n"
        ")");
}

TEST_CASE("Unique group lifecycle", "[ddl][unique]") {
    auto applied = model_m().describe();

    auto with_group = model_m().unique_group("ne", { "id", "name" }).describe();
    auto cs = diff(&applied, with_group);
    REQUIRE(cs.changes.size() == 1);
    REQUIRE(cs.changes[0] == add_unique_group(UniqueGroup { "ne", { "id", "name" } }));

    auto sql = generate_sql("M", cs);
    REQUIRE(sql == std::vector<std::string> {
        "ALTER TABLE \"M\" ADD CONSTRAINT \"__UNQ_M_ne__\" UNIQUE (\"id\", \"name\")" });

    auto widened = model_m().field("extra", "int").unique_group("ne", { "id", "name", "extra" }).describe();
    auto cs2 = diff(&with_group, widened);
    REQUIRE(cs2.changes.size() == 2);
    REQUIRE(cs2.changes[0] == add_field(FieldSpec { "extra", "int" }));
    REQUIRE(cs2.changes[1] == modify_unique_group(UniqueGroup { "ne", { "id", "name", "extra" } }));

    auto sql2 = generate_sql("M", cs2);
    REQUIRE(sql2 == std::vector<std::string> {
        "ALTER TABLE \"M\" DROP CONSTRAINT IF EXISTS \"__UNQ_M_ne__\"",
        "ALTER TABLE \"M\" ADD COLUMN \"extra\" int",
        "ALTER TABLE \"M\" ADD CONSTRAINT \"__UNQ_M_ne__\" UNIQUE (\"id\", \"name\", \"extra\")" });
}

TEST_CASE("Incremental statements follow dependency order", "[ddl][order]") {
    ChangeSet cs;
    cs.table = "t";
    // deliberately shuffled
    cs.changes = {
        add_unique_group(UniqueGroup { "g2", { "c" } }),
        add_index("c", IndexSpec::parse("hash")),
        alter_field("b", { "TYPE text", "SET NOT NULL" }),
        add_field(FieldSpec { "c", "int", "DEFAULT 0" }),
        drop_field(FieldSpec { "a", "int" }),
        drop_index("b", IndexSpec::parse("btree")),
        drop_unique_group("g1"),
    };

    auto sql = generate_sql("t", cs);
    REQUIRE(sql == std::vector<std::string> {
        "ALTER TABLE \"t\" DROP CONSTRAINT IF EXISTS \"__UNQ_t_g1__\"",
        "DROP INDEX IF EXISTS \"__IDX_t_b_btree__\"",
        "ALTER TABLE \"t\" DROP COLUMN \"a\"",
        "ALTER TABLE \"t\" ADD COLUMN \"c\" int DEFAULT 0",
        "ALTER TABLE \"t\" ALTER COLUMN \"b\" TYPE text",
        "ALTER TABLE \"t\" ALTER COLUMN \"b\" SET NOT NULL",
        "CREATE INDEX IF NOT EXISTS \"__IDX_t_c_hash__\" ON \"t\" USING hash (\"c\")",
        "ALTER TABLE \"t\" ADD CONSTRAINT \"__UNQ_t_g2__\" UNIQUE (\"c\")" });
}

TEST_CASE("Full create carries constraints, alters and indexes", "[ddl][create]") {
    auto s = ModelDecl("SiteUser")
        .table("site_user")
        .pk("id")
        .field("id", "SERIAL", "NOT NULL")
        .field(make_field("name", "varchar(255)").index("gin:gin_trgm_ops").index("-hash"))
        .field(make_field("profession", "varchar(65)").alter("SET DEFAULT 'Unknown'"))
        .field(make_field("email", "varchar(255)").unique())
        .unique_group("np", { "name", "profession" })
        .describe();

    auto sql = generate_sql("site_user", diff(nullptr, s));
    REQUIRE(sql == std::vector<std::string> {
        "CREATE TABLE \"site_user\" (\n"
        "    \"id\" SERIAL NOT NULL,\n"
        "    \"name\" varchar(255),\n"
        "    \"profession\" varchar(65),\n"
        "    \"email\" varchar(255),\n"
        "    PRIMARY KEY (\"id\")\n"
        ")",
        "ALTER TABLE \"site_user\" ADD CONSTRAINT \"__UNQ_site_user_np__\" UNIQUE (\"name\", \"profession\")",
        "ALTER TABLE \"site_user\" ADD CONSTRAINT \"__UNQ_site_user_email__\" UNIQUE (\"email\")",
        "ALTER TABLE \"site_user\" ALTER COLUMN \"profession\" SET DEFAULT 'Unknown'",
        "CREATE INDEX IF NOT EXISTS \"__IDX_site_user_name_gin__\" ON \"site_user\" USING gin (\"name\" gin_trgm_ops)" });
}

TEST_CASE("Table rename creates the new table then drops the old one", "[ddl][create]") {
    auto old_schema = model_m().describe();
    auto renamed = model_m().table("m2").describe();

    auto sql = generate_sql("m2", plan_changes(&old_schema, renamed));
    REQUIRE(sql.size() == 2);
    REQUIRE(sql[0].rfind("CREATE TABLE \"m2\" (", 0) == 0);
    REQUIRE(sql[1] == "DROP TABLE IF EXISTS \"M\"");
}

TEST_CASE("Identifiers are always quoted", "[ddl]") {
    PgDDLVisitor pg;
    REQUIRE(pg.drop_column("order", "select") == "ALTER TABLE \"order\" DROP COLUMN \"select\"");
    REQUIRE(pg.drop_table("we\"ird") == "DROP TABLE IF EXISTS \"we\"\"ird\"");
}

TEST_CASE("Records that can not be rendered", "[ddl][error]") {
    ChangeSet cs;
    cs.table = "t";

    SECTION("empty alter fragment list") {
        cs.changes = { alter_field("a", {}) };
        REQUIRE_THROWS_AS(generate_sql("t", cs), GenerationError);
    }
    SECTION("empty alter fragment") {
        cs.changes = { alter_field("a", { "" }) };
        REQUIRE_THROWS_AS(generate_sql("t", cs), GenerationError);
    }
    SECTION("column without type") {
        cs.changes = { add_field(FieldSpec { "a", "" }) };
        REQUIRE_THROWS_AS(generate_sql("t", cs), GenerationError);
    }
    SECTION("index kind with punctuation") {
        cs.changes = { add_index("a", IndexSpec::parse("btree); DROP TABLE t; --")) };
        REQUIRE_THROWS_AS(generate_sql("t", cs), GenerationError);
    }
    SECTION("unique group without fields") {
        cs.changes = { add_unique_group(UniqueGroup { "g", {} }) };
        REQUIRE_THROWS_AS(generate_sql("t", cs), GenerationError);
    }
    SECTION("drop table outside a create") {
        cs.changes = { drop_table("old") };
        REQUIRE_THROWS_AS(generate_sql("t", cs), GenerationError);
    }
    SECTION("other records next to a create") {
        cs.create = model_m().describe();
        cs.table = "M";
        cs.changes = { drop_field(FieldSpec { "a", "int" }) };
        REQUIRE_THROWS_AS(generate_sql("M", cs), GenerationError);
    }
}

TEST_CASE("join_sql terminates every statement", "[ddl]") {
    REQUIRE(join_sql({}) == "");
    REQUIRE(join_sql({ "A", "B" }) == "A;\nB;");
}
