#ifndef LOCAL_STORE_HPP
#define LOCAL_STORE_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace local_store
{
    using Filter = std::function<bool(const json &)>;

    // Sort key for queryOrdered. An empty field keeps key order.
    struct OrderBy
    {
        std::string field;
        bool ascending = true;
    };

    // Durable key/value persistence grouped in collections. Every put is an
    // atomic single-record upsert; there are no multi-record transactions.
    class LocalStore
    {
    public:
        virtual ~LocalStore() = default;

        // nullopt when the key is absent. Throws errors::SyncError(Storage)
        // when the backend itself fails.
        virtual std::optional<json> get(const std::string &collection, const std::string &key) = 0;
        virtual bool put(const std::string &collection, const std::string &key, const json &record) = 0;
        virtual bool remove(const std::string &collection, const std::string &key) = 0;
        virtual std::vector<json> queryOrdered(const std::string &collection,
                                               const Filter &filter,
                                               const OrderBy &order = OrderBy()) = 0;
    };

    // Stable sort on order.field; numbers compare numerically, everything
    // else by its dump. Records missing the field sort last either way.
    void sortRecords(std::vector<json> &records, const OrderBy &order);

    inline Filter fieldEquals(const std::string &field, const json &value)
    {
        return [field, value](const json &record)
        {
            return record.contains(field) && record.at(field) == value;
        };
    }

    inline Filter matchAll()
    {
        return [](const json &) { return true; };
    }
} // namespace local_store

#endif // LOCAL_STORE_HPP
