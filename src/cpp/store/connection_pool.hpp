#pragma once
// Fixed-size pool of CredentialStore connections.
//
// acquire() blocks while every connection is leased out. A Lease hands its
// connection back on destruction, so every exit path of a file-processing
// run releases it. A connection found broken on acquire is reconnected.
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "credential_store.hpp"
#include "../utils/cancellation.hpp"

namespace credingest {

class ConnectionPool;

class Lease {
public:
    Lease() = default;
    Lease(ConnectionPool* pool, std::unique_ptr<CredentialStore> store)
        : pool_(pool), store_(std::move(store)) {}
    ~Lease() { release(); }

    Lease(Lease&& o) noexcept : pool_(o.pool_), store_(std::move(o.store_)) { o.pool_ = nullptr; }
    Lease& operator=(Lease&& o) noexcept {
        if (this != &o) {
            release();
            pool_ = o.pool_;
            store_ = std::move(o.store_);
            o.pool_ = nullptr;
        }
        return *this;
    }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    explicit operator bool() const { return store_ != nullptr; }
    CredentialStore& operator*() const { return *store_; }
    CredentialStore* operator->() const { return store_.get(); }

    void release();

private:
    ConnectionPool* pool_ = nullptr;
    std::unique_ptr<CredentialStore> store_;
};

class ConnectionPool {
public:
    using Factory = std::function<std::unique_ptr<CredentialStore>()>;

    ConnectionPool(Factory factory, StoreConnection conn, size_t size);

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Connects every slot; false if none could be opened
    bool open();
    void close();

    // Blocks until a connection is free. Empty Lease once the token stops
    // or the pool is closed.
    Lease acquire(const CancellationToken& token);
    Lease acquire() { return acquire(CancellationToken()); }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] size_t available() const;
    [[nodiscard]] const StoreConnection& connection() const { return conn_; }

private:
    friend class Lease;
    void give_back(std::unique_ptr<CredentialStore> store);

    Factory factory_;
    StoreConnection conn_;
    size_t size_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<CredentialStore>> idle_;
    bool closed_ = true;
};

} // namespace credingest
