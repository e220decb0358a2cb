#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include "sqlconnection.hpp"

namespace pool {

enum class DbIntent { Read,
    Write };
enum class PoolAcquireError { Timeout,
    Shutdown };

struct PoolStats {
    std::size_t size { 0 };      // capacity
    std::size_t open { 0 };      // connections currently opened
    std::size_t in_use { 0 };
    std::size_t waiters { 0 };
    std::size_t discarded { 0 }; // dropped because they could not be rolled back
};

struct AcquirePolicy {
    std::chrono::milliseconds acquire_timeout { 30000 }; // never block forever
};

class IDbPool;

// --------- RAII Lease ----------
// The connection goes back to its pool when the lease dies.
class Lease {
public:
    Lease(IDbPool* owner, std::shared_ptr<SQLConnection> conn, DbIntent intent)
        : owner_(owner)
        , conn_(std::move(conn))
        , intent_(intent) { }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& other) noexcept
        : owner_(std::exchange(other.owner_, nullptr))
        , conn_(std::move(other.conn_))
        , intent_(other.intent_) { }

    Lease& operator=(Lease&& other) noexcept {
        if (this != &other) {
            give_back();
            owner_ = std::exchange(other.owner_, nullptr);
            conn_ = std::move(other.conn_);
            intent_ = other.intent_;
        }
        return *this;
    }

    ~Lease() { give_back(); }

    SQLConnection& conn() const { return *conn_; }
    DbIntent intent() const { return intent_; }
    explicit operator bool() const { return conn_ != nullptr; }

private:
    void give_back() noexcept;

    IDbPool* owner_ { nullptr };
    std::shared_ptr<SQLConnection> conn_;
    DbIntent intent_ { DbIntent::Read };
};

// --------- Pool interface ----------
class IDbPool {
public:
    virtual ~IDbPool() = default;

    struct AcquireResult {
        bool ok { false };
        Lease lease { nullptr, nullptr, DbIntent::Read };
        PoolAcquireError error { PoolAcquireError::Timeout };
    };

    // timeout 0 = the pool's policy
    virtual AcquireResult acquire(DbIntent intent,
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero())
        = 0;

    virtual PoolStats stats() const = 0;
    virtual void shutdown() = 0;

protected:
    // Only leases hand connections back
    virtual void release(std::shared_ptr<SQLConnection> conn, DbIntent intent) noexcept = 0;
    friend class Lease;
};

inline void Lease::give_back() noexcept {
    if (owner_ && conn_) owner_->release(std::move(conn_), intent_);
    owner_ = nullptr;
    conn_.reset();
}

// Lease or throw: a migration can not proceed without a connection.
Lease acquire_or_throw(IDbPool& db, DbIntent intent,
    std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

} // namespace pool

/**
 * DbPool
 *  - fixed capacity, every connection opened up front so a bad dsn fails early
 *  - a connection handed back inside a transaction is rolled back first;
 *    when that fails it is dropped and a new one is opened on demand
 *  - shutdown() wakes every waiter with PoolAcquireError::Shutdown
 */
class DbPool final : public pool::IDbPool {
public:
    using Factory = std::function<PSQLConnection()>;

    DbPool(std::size_t capacity, std::string dsn, Factory factory, pool::AcquirePolicy policy = {});
    ~DbPool() override;

    DbPool(const DbPool&) = delete;
    DbPool& operator=(const DbPool&) = delete;

    AcquireResult acquire(pool::DbIntent intent,
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()) override;

    pool::PoolStats stats() const override;
    void shutdown() override;

protected:
    void release(std::shared_ptr<SQLConnection> conn, pool::DbIntent intent) noexcept override;

private:
    std::shared_ptr<SQLConnection> open_connection();

    const std::size_t cap_;
    const std::string dsn_;
    const Factory factory_;
    const pool::AcquirePolicy policy_;

    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<SQLConnection>> idle_;
    std::size_t open_ { 0 };
    std::size_t in_use_ { 0 };
    std::size_t waiters_ { 0 };
    std::size_t discarded_ { 0 };
    bool shutdown_ { false };
};
