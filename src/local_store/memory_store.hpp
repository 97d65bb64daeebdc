#pragma once

#include <map>
#include <mutex>
#include "local_store.hpp"

namespace local_store
{
    // Non-durable store for tests and for running without a database file.
    class MemoryStore : public LocalStore
    {
    public:
        std::optional<json> get(const std::string &collection, const std::string &key) override;
        bool put(const std::string &collection, const std::string &key, const json &record) override;
        bool remove(const std::string &collection, const std::string &key) override;
        std::vector<json> queryOrdered(const std::string &collection,
                                       const Filter &filter,
                                       const OrderBy &order = OrderBy()) override;

        size_t size(const std::string &collection);

    private:
        std::mutex mutex_;
        std::map<std::string, std::map<std::string, json>> collections_;
    };
} // namespace local_store
