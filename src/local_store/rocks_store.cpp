#include "rocks_store.hpp"
#include "../errors/errors.hpp"
#include "../fsUtils/fsUtils.hpp"
#include "../logger/Mylogger.hpp"
#include "rocksdb/options.h"

namespace local_store
{
    RocksStore::RocksStore(const std::string &db_path)
    {
        fsUtils::ensureParentDirectory(db_path);

        rocksdb::Options options;
        options.create_if_missing = true;

        rocksdb::DB *raw_db = nullptr;
        rocksdb::Status status = rocksdb::DB::Open(options, db_path, &raw_db);
        if (!status.ok())
        {
            MyLogger::error("Failed to open RocksDB at " + db_path + ": " + status.ToString());
            throw errors::SyncError(errors::ErrorKind::Storage, "Failed to open RocksDB: " + status.ToString());
        }
        db_.reset(raw_db);
        write_options_.sync = true;
        MyLogger::info("RocksDB opened at " + db_path);
    }

    std::string RocksStore::makeKey(const std::string &collection, const std::string &key)
    {
        return collection + "/" + key;
    }

    std::optional<json> RocksStore::get(const std::string &collection, const std::string &key)
    {
        std::string value;
        rocksdb::Status status = db_->Get(rocksdb::ReadOptions(), makeKey(collection, key), &value);
        if (status.IsNotFound())
            return std::nullopt;
        if (!status.ok())
        {
            MyLogger::error("RocksDB GET failed for " + makeKey(collection, key) + ": " + status.ToString());
            throw errors::SyncError(errors::ErrorKind::Storage, status.ToString());
        }
        try
        {
            return json::parse(value);
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("Corrupt record at " + makeKey(collection, key) + ": " + e.what());
            throw errors::SyncError(errors::ErrorKind::Storage, std::string("Corrupt record: ") + e.what());
        }
    }

    bool RocksStore::put(const std::string &collection, const std::string &key, const json &record)
    {
        rocksdb::Status status = db_->Put(write_options_, makeKey(collection, key), record.dump());
        if (!status.ok())
        {
            MyLogger::error("RocksDB PUT failed for " + makeKey(collection, key) + ": " + status.ToString());
            return false;
        }
        return true;
    }

    bool RocksStore::remove(const std::string &collection, const std::string &key)
    {
        rocksdb::Status status = db_->Delete(write_options_, makeKey(collection, key));
        if (!status.ok())
        {
            MyLogger::error("RocksDB DELETE failed for " + makeKey(collection, key) + ": " + status.ToString());
            return false;
        }
        return true;
    }

    std::vector<json> RocksStore::queryOrdered(const std::string &collection,
                                               const Filter &filter,
                                               const OrderBy &order)
    {
        std::vector<json> result;
        const std::string prefix = collection + "/";
        std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));

        for (it->Seek(prefix); it->Valid(); it->Next())
        {
            std::string key = it->key().ToString();
            if (key.compare(0, prefix.size(), prefix) != 0)
                break;
            try
            {
                json record = json::parse(it->value().ToString());
                if (!filter || filter(record))
                    result.push_back(std::move(record));
            }
            catch (const json::parse_error &e)
            {
                MyLogger::warning("Skipping corrupt record " + key + ": " + e.what());
            }
        }
        if (!it->status().ok())
        {
            MyLogger::error("RocksDB scan of " + collection + " failed: " + it->status().ToString());
            throw errors::SyncError(errors::ErrorKind::Storage, it->status().ToString());
        }
        sortRecords(result, order);
        return result;
    }
} // namespace local_store
