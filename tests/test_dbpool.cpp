#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

#include <catch2/catch.hpp>
#include "dbpool.hpp"
#include "fake_sql.hpp"

using namespace std::chrono_literals;
using pool::AcquirePolicy;
using pool::DbIntent;
using pool::Lease;
using pool::PoolAcquireError;

namespace {

    AcquirePolicy quick(std::chrono::milliseconds timeout) {
        AcquirePolicy pol;
        pol.acquire_timeout = timeout;
        return pol;
    }

    DbPool::Factory fake_factory(std::atomic<int>* created = nullptr) {
        return [created]() -> PSQLConnection {
            if (created) ++*created;
            return std::make_unique<FakeSQLConnection>();
        };
    }

}

TEST_CASE("Pool opens every connection up front", "[pool]") {
    std::atomic<int> created { 0 };
    DbPool db(3, "fake://", fake_factory(&created), quick(200ms));
    REQUIRE(created == 3);
    REQUIRE(db.stats().size == 3u);
    REQUIRE(db.stats().open == 3u);
    REQUIRE(db.stats().in_use == 0u);
}

TEST_CASE("RAII release returns connection", "[pool][raii]") {
    DbPool db(2, "fake://", fake_factory(), quick(200ms));

    auto a = db.acquire(DbIntent::Write);
    REQUIRE(a.ok);
    CHECK(db.stats().in_use == 1u);
    {
        auto b = db.acquire(DbIntent::Read);
        REQUIRE(b.ok);
        CHECK(db.stats().in_use == 2u);
    }
    CHECK(db.stats().in_use == 1u);

    // moved lease releases once
    Lease moved = std::move(a.lease);
    REQUIRE(moved);
    REQUIRE_FALSE(a.lease);
    CHECK(db.stats().in_use == 1u);
}

TEST_CASE("Acquire times out when exhausted", "[pool][timeout]") {
    DbPool db(1, "fake://", fake_factory(), quick(100ms));
    auto held = db.acquire(DbIntent::Write);
    REQUIRE(held.ok);

    auto r = db.acquire(DbIntent::Write);
    REQUIRE_FALSE(r.ok);
    CHECK(r.error == PoolAcquireError::Timeout);

    // per call override
    auto start = std::chrono::steady_clock::now();
    auto r2 = db.acquire(DbIntent::Write, 20ms);
    REQUIRE_FALSE(r2.ok);
    CHECK(std::chrono::steady_clock::now() - start < 100ms);
}

TEST_CASE("Waiter gets the connection released by another thread", "[pool]") {
    DbPool db(1, "fake://", fake_factory(), quick(2s));
    std::optional<Lease> held = std::move(db.acquire(DbIntent::Write).lease);
    REQUIRE((held && *held));

    std::atomic<bool> got { false };
    std::thread waiter([&] {
        auto r = db.acquire(DbIntent::Write);
        got = r.ok;
    });

    std::this_thread::sleep_for(50ms);
    CHECK_FALSE(got.load());
    held.reset();
    waiter.join();
    CHECK(got.load());
}

TEST_CASE("Shutdown wakes waiters", "[pool][shutdown]") {
    DbPool db(0, "fake://", fake_factory(), quick(10s));

    std::atomic<bool> saw_shutdown { false };
    std::thread waiter([&] {
        auto r = db.acquire(DbIntent::Write);
        if (!r.ok) saw_shutdown = (r.error == PoolAcquireError::Shutdown);
    });

    std::this_thread::sleep_for(100ms);
    db.shutdown();
    waiter.join();
    CHECK(saw_shutdown.load());
}

TEST_CASE("acquire_or_throw turns a failed acquire into an error", "[pool][error]") {
    DbPool db(1, "fake://", fake_factory(), quick(50ms));
    {
        auto lease = pool::acquire_or_throw(db, DbIntent::Write);
        REQUIRE(lease);
        REQUIRE(lease.conn().driver() == "fake");
        REQUIRE_THROWS_WITH(pool::acquire_or_throw(db, DbIntent::Write), Catch::Contains("acquire timeout"));
    }
    db.shutdown();
    REQUIRE_THROWS_WITH(pool::acquire_or_throw(db, DbIntent::Write), Catch::Contains("pool shut down"));
}

TEST_CASE("Pool rejects a broken factory", "[pool][error]") {
    REQUIRE_THROWS(DbPool(1, "x", nullptr));
    REQUIRE_THROWS(DbPool(1, "x", []() -> PSQLConnection { return nullptr; }));
}

TEST_CASE("Connection returned inside a transaction is rolled back", "[pool][transaction]") {
    DbPool db(1, "fake://", fake_factory(), quick(100ms));
    FakeSQLConnection* fake = nullptr;
    {
        auto lease = pool::acquire_or_throw(db, DbIntent::Write);
        fake = dynamic_cast<FakeSQLConnection*>(&lease.conn());
        REQUIRE(fake != nullptr);
        REQUIRE(lease.conn().begin());
    }
    REQUIRE(fake->rollbacks == 1);

    auto again = pool::acquire_or_throw(db, DbIntent::Write);
    REQUIRE(&again.conn() == fake);
    REQUIRE_FALSE(again.conn().in_transaction());
}

TEST_CASE("Connection that can not roll back is replaced", "[pool][transaction]") {
    std::atomic<int> created { 0 };
    DbPool db(1, "fake://", fake_factory(&created), quick(100ms));
    FakeSQLConnection* broken = nullptr;
    {
        auto lease = pool::acquire_or_throw(db, DbIntent::Write);
        broken = dynamic_cast<FakeSQLConnection*>(&lease.conn());
        broken->fail_rollback = true;
        lease.conn().begin();
    }
    REQUIRE(db.stats().discarded == 1u);
    REQUIRE(db.stats().open == 0u);

    auto fresh = pool::acquire_or_throw(db, DbIntent::Write);
    REQUIRE(created == 2);
    REQUIRE(db.stats().open == 1u);
    REQUIRE_FALSE(fresh.conn().in_transaction());
}
