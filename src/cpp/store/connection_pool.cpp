#include "connection_pool.hpp"
#include "../utils/logger.hpp"

#include <chrono>

namespace credingest {

void Lease::release() {
    if (pool_ && store_) {
        pool_->give_back(std::move(store_));
    }
    pool_ = nullptr;
}

ConnectionPool::ConnectionPool(Factory factory, StoreConnection conn, size_t size)
    : factory_(std::move(factory)), conn_(std::move(conn)), size_(size == 0 ? 1 : size) {}

bool ConnectionPool::open() {
    std::vector<std::unique_ptr<CredentialStore>> stores;
    size_t connected = 0;
    for (size_t i = 0; i < size_; ++i) {
        auto store = factory_();
        if (store->connect(conn_)) {
            ++connected;
        } else {
            LOG_WRN("[pool] Slot %zu failed to connect -- will retry on acquire", i);
        }
        stores.push_back(std::move(store));
    }

    if (connected == 0) {
        LOG_ERR("[pool] No connection could be opened");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_ = std::move(stores);
        closed_ = false;
    }
    cv_.notify_all();
    LOG_INF("[pool] Opened %zu/%zu connections", connected, size_);
    return true;
}

void ConnectionPool::close() {
    std::vector<std::unique_ptr<CredentialStore>> stores;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        stores.swap(idle_);
    }
    cv_.notify_all();
    for (auto& s : stores) s->disconnect();
}

Lease ConnectionPool::acquire(const CancellationToken& token) {
    std::unique_ptr<CredentialStore> store;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!closed_ && idle_.empty()) {
            if (token.stop_requested()) return Lease();
            // Cancellation has its own condition variable; poll it in slices
            cv_.wait_for(lock, std::chrono::milliseconds(100));
        }
        if (closed_ || token.stop_requested()) return Lease();
        store = std::move(idle_.back());
        idle_.pop_back();
    }

    if (!store->ensure_connected(conn_)) {
        LOG_ERR("[pool] Leased connection is down and could not be re-established");
        give_back(std::move(store));
        return Lease();
    }
    return Lease(this, std::move(store));
}

void ConnectionPool::give_back(std::unique_ptr<CredentialStore> store) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            store->disconnect();
            return;
        }
        idle_.push_back(std::move(store));
    }
    cv_.notify_one();
}

size_t ConnectionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

} // namespace credingest
