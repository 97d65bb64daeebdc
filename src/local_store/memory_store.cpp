#include "memory_store.hpp"

namespace local_store
{
    std::optional<json> MemoryStore::get(const std::string &collection, const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto coll = collections_.find(collection);
        if (coll == collections_.end())
            return std::nullopt;
        auto it = coll->second.find(key);
        if (it == coll->second.end())
            return std::nullopt;
        return it->second;
    }

    bool MemoryStore::put(const std::string &collection, const std::string &key, const json &record)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        collections_[collection][key] = record;
        return true;
    }

    bool MemoryStore::remove(const std::string &collection, const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto coll = collections_.find(collection);
        if (coll == collections_.end())
            return false;
        return coll->second.erase(key) > 0;
    }

    std::vector<json> MemoryStore::queryOrdered(const std::string &collection,
                                                const Filter &filter,
                                                const OrderBy &order)
    {
        std::vector<json> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto coll = collections_.find(collection);
            if (coll != collections_.end())
            {
                for (const auto &entry : coll->second)
                {
                    if (!filter || filter(entry.second))
                        result.push_back(entry.second);
                }
            }
        }
        sortRecords(result, order);
        return result;
    }

    size_t MemoryStore::size(const std::string &collection)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto coll = collections_.find(collection);
        return coll == collections_.end() ? 0 : coll->second.size();
    }
} // namespace local_store
