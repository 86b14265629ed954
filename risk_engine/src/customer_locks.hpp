#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

// Serialises work per customer id inside one process. Entries are reference
// counted and removed once no caller holds or waits on them.
class CustomerLockTable {
    struct Entry {
        std::mutex mutex;
        int users = 0;
    };

public:
    class Guard {
    public:
        Guard(CustomerLockTable& table, std::string customer_id, std::shared_ptr<Entry> entry);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        CustomerLockTable& table_;
        std::string customer_id_;
        std::shared_ptr<Entry> entry_;
    };

    std::unique_ptr<Guard> acquire(const std::string& customer_id);

    size_t size() const;

private:
    void release(const std::string& customer_id);

    mutable std::mutex table_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};
