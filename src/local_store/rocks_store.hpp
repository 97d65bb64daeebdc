#ifndef ROCKS_STORE_HPP
#define ROCKS_STORE_HPP

#include <memory>
#include "local_store.hpp"
#include "rocksdb/db.h"

namespace local_store
{
    // RocksDB-backed store. Keys are laid out as "<collection>/<key>" and
    // values are compact JSON dumps. Writes are synced to disk.
    class RocksStore : public LocalStore
    {
    public:
        // Opens (creating if needed) the database at db_path.
        // Throws errors::SyncError(Storage) if RocksDB refuses.
        explicit RocksStore(const std::string &db_path);

        std::optional<json> get(const std::string &collection, const std::string &key) override;
        bool put(const std::string &collection, const std::string &key, const json &record) override;
        bool remove(const std::string &collection, const std::string &key) override;
        std::vector<json> queryOrdered(const std::string &collection,
                                       const Filter &filter,
                                       const OrderBy &order = OrderBy()) override;

    private:
        static std::string makeKey(const std::string &collection, const std::string &key);

        std::shared_ptr<rocksdb::DB> db_;
        rocksdb::WriteOptions write_options_;
    };
} // namespace local_store

#endif // ROCKS_STORE_HPP
