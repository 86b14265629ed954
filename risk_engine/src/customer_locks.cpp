#include "customer_locks.hpp"

CustomerLockTable::Guard::Guard(CustomerLockTable& table, std::string customer_id,
                                std::shared_ptr<Entry> entry)
    : table_(table), customer_id_(std::move(customer_id)), entry_(std::move(entry)) {
    entry_->mutex.lock();
}

CustomerLockTable::Guard::~Guard() {
    entry_->mutex.unlock();
    table_.release(customer_id_);
}

std::unique_ptr<CustomerLockTable::Guard> CustomerLockTable::acquire(const std::string& customer_id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        auto& slot = entries_[customer_id];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        slot->users++;
        entry = slot;
    }
    return std::make_unique<Guard>(*this, customer_id, entry);
}

size_t CustomerLockTable::size() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return entries_.size();
}

void CustomerLockTable::release(const std::string& customer_id) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = entries_.find(customer_id);
    if (it != entries_.end() && --it->second->users == 0) {
        entries_.erase(it);
    }
}
