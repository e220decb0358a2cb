#include "dbpool.hpp"
#include "lib.hpp"

namespace pool {

Lease acquire_or_throw(IDbPool& db, DbIntent intent, std::chrono::milliseconds timeout) {
    auto ac = db.acquire(intent, timeout);
    if (!ac.ok) {
        THROW("No database connection available: %s",
            ac.error == PoolAcquireError::Shutdown ? "pool shut down" : "acquire timeout");
    }
    return std::move(ac.lease);
}

} // namespace pool

DbPool::DbPool(std::size_t capacity, std::string dsn, Factory factory, pool::AcquirePolicy policy)
    : cap_(capacity)
    , dsn_(std::move(dsn))
    , factory_(std::move(factory))
    , policy_(policy) {
    if (!factory_) THROW("DbPool: null connection factory");
    for (std::size_t i = 0; i < cap_; ++i) {
        idle_.push_back(open_connection());
        ++open_;
    }
    SPDLOG_DEBUG("Connection pool ready: {} connection(s)", cap_);
}

DbPool::~DbPool() {
    shutdown();
}

std::shared_ptr<SQLConnection> DbPool::open_connection() {
    PSQLConnection up = factory_();
    if (!up) THROW("DbPool: factory returned null connection");
    up->connect(dsn_);
    return std::shared_ptr<SQLConnection>(std::move(up));
}

DbPool::AcquireResult DbPool::acquire(pool::DbIntent intent, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + (timeout.count() > 0 ? timeout : policy_.acquire_timeout);

    std::unique_lock<std::mutex> lk(mx_);
    ++waiters_;
    bool ready = cv_.wait_until(lk, deadline, [&] { return shutdown_ || !idle_.empty() || open_ < cap_; });
    --waiters_;

    if (shutdown_) return { false, { nullptr, nullptr, intent }, pool::PoolAcquireError::Shutdown };
    if (!ready) return { false, { nullptr, nullptr, intent }, pool::PoolAcquireError::Timeout };

    std::shared_ptr<SQLConnection> conn;
    if (!idle_.empty()) {
        conn = std::move(idle_.front());
        idle_.pop_front();
    } else {
        // replaces a dropped connection; the slot is taken before connecting
        ++open_;
        lk.unlock();
        try {
            conn = open_connection();
        } catch (...) {
            lk.lock();
            --open_;
            cv_.notify_one();
            throw;
        }
        lk.lock();
    }
    ++in_use_;
    return { true, pool::Lease { this, std::move(conn), intent }, {} };
}

void DbPool::release(std::shared_ptr<SQLConnection> conn, pool::DbIntent) noexcept {
    bool keep = true;
    if (conn->in_transaction()) {
        SPDLOG_WARN("Connection returned inside a transaction, rolling back");
        try {
            conn->rollback();
        } catch (const std::exception& e) {
            SPDLOG_ERROR("Rollback on release failed, dropping the connection: {}", e.what());
            keep = false;
        }
    }

    std::lock_guard<std::mutex> lk(mx_);
    --in_use_;
    if (keep && !shutdown_) {
        idle_.push_back(std::move(conn));
    } else {
        --open_;
        if (!keep) ++discarded_;
    }
    cv_.notify_one();
}

pool::PoolStats DbPool::stats() const {
    std::lock_guard<std::mutex> lk(mx_);
    pool::PoolStats s;
    s.size = cap_;
    s.open = open_;
    s.in_use = in_use_;
    s.waiters = waiters_;
    s.discarded = discarded_;
    return s;
}

void DbPool::shutdown() {
    std::lock_guard<std::mutex> lk(mx_);
    if (shutdown_) return;
    shutdown_ = true;
    open_ -= idle_.size();
    idle_.clear();
    cv_.notify_all();
}
