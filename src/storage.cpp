#include "attest/storage.hpp"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <filesystem>
#include <format>

namespace attest
{

    namespace storage_keys
    {
        std::string pad_sequence(uint64_t n)
        {
            return std::format("{:020d}", n);
        }

        std::string event(const std::string &event_id)
        {
            return kEventPrefix + event_id;
        }

        std::string event_seq(uint64_t seq)
        {
            return kEventSeqPrefix + pad_sequence(seq);
        }

        std::string chain(uint64_t position)
        {
            return kChainPrefix + pad_sequence(position);
        }

        std::string chain_index(const std::string &event_id)
        {
            return kChainIndexPrefix + event_id;
        }
    } // namespace storage_keys

    void StorageBatch::put(std::string key, std::string value)
    {
        ops_.push_back(Op{std::move(key), std::move(value)});
    }

    void StorageBatch::erase(std::string key)
    {
        ops_.push_back(Op{std::move(key), std::nullopt});
    }

    class RocksDbStorage::Impl
    {
    public:
        explicit Impl(const StorageConfig &cfg)
            : path(cfg.rocksdb_path)
        {
            std::error_code ec;
            auto parent = std::filesystem::path(cfg.rocksdb_path).parent_path();
            if (!parent.empty())
                std::filesystem::create_directories(parent, ec);

            rocksdb::Options options;
            options.create_if_missing = true;
            rocksdb::DB *raw = nullptr;
            auto status = rocksdb::DB::Open(options, cfg.rocksdb_path, &raw);
            if (!status.ok())
            {
                throw AttestError::storage("RocksDB open failed: " + status.ToString());
            }
            db.reset(raw);
            write_options.sync = cfg.sync_writes;
        }

        bool starts_with(const rocksdb::Slice &key, const std::string &prefix) const
        {
            return key.starts_with(rocksdb::Slice(prefix));
        }

        std::string path;
        std::unique_ptr<rocksdb::DB> db;
        rocksdb::WriteOptions write_options;
    };

    RocksDbStorage::RocksDbStorage(const StorageConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    RocksDbStorage::~RocksDbStorage() = default;

    Result<std::shared_ptr<RocksDbStorage>> RocksDbStorage::open(const StorageConfig &cfg)
    {
        try
        {
            return std::make_shared<RocksDbStorage>(cfg);
        }
        catch (const AttestError &e)
        {
            return std::unexpected(e);
        }
    }

    Result<std::optional<std::string>> RocksDbStorage::get(const std::string &key) const
    {
        std::string value;
        auto status = impl_->db->Get(rocksdb::ReadOptions(), key, &value);
        if (status.IsNotFound())
            return std::optional<std::string>{};
        if (!status.ok())
            return std::unexpected(AttestError::storage(std::format("RocksDB Get {} failed: {}", key, status.ToString())));
        return std::optional<std::string>(std::move(value));
    }

    Result<void> RocksDbStorage::put(const std::string &key, const std::string &value)
    {
        auto status = impl_->db->Put(impl_->write_options, key, value);
        if (!status.ok())
            return std::unexpected(AttestError::storage(std::format("RocksDB Put {} failed: {}", key, status.ToString())));
        return {};
    }

    Result<void> RocksDbStorage::erase(const std::string &key)
    {
        auto status = impl_->db->Delete(impl_->write_options, key);
        if (!status.ok())
            return std::unexpected(AttestError::storage(std::format("RocksDB Delete {} failed: {}", key, status.ToString())));
        return {};
    }

    Result<void> RocksDbStorage::write(const StorageBatch &batch)
    {
        rocksdb::WriteBatch wb;
        for (const auto &op : batch.ops())
        {
            auto status = op.value ? wb.Put(op.key, *op.value) : wb.Delete(op.key);
            if (!status.ok())
                return std::unexpected(AttestError::storage("RocksDB batch build failed: " + status.ToString()));
        }
        auto status = impl_->db->Write(impl_->write_options, &wb);
        if (!status.ok())
            return std::unexpected(AttestError::storage("RocksDB Write failed: " + status.ToString()));
        return {};
    }

    Result<std::vector<KeyValue>> RocksDbStorage::scan_prefix(const std::string &prefix,
                                                              std::size_t offset,
                                                              std::optional<std::size_t> limit,
                                                              bool reverse) const
    {
        std::vector<KeyValue> out;
        std::unique_ptr<rocksdb::Iterator> it(impl_->db->NewIterator(rocksdb::ReadOptions()));

        std::size_t skipped = 0;
        auto visit = [&]() -> bool
        {
            if (skipped < offset)
            {
                ++skipped;
                return true;
            }
            if (limit && out.size() >= *limit)
                return false;
            out.emplace_back(it->key().ToString(), it->value().ToString());
            return true;
        };

        if (reverse)
        {
            // '\xff' sorts after every printable key byte used in the layout
            it->SeekForPrev(prefix + '\xff');
            for (; it->Valid() && impl_->starts_with(it->key(), prefix); it->Prev())
            {
                if (!visit())
                    break;
            }
        }
        else
        {
            for (it->Seek(prefix); it->Valid() && impl_->starts_with(it->key(), prefix); it->Next())
            {
                if (!visit())
                    break;
            }
        }

        if (!it->status().ok())
            return std::unexpected(AttestError::storage("RocksDB scan failed: " + it->status().ToString()));
        return out;
    }

    Result<std::optional<KeyValue>> RocksDbStorage::last_with_prefix(const std::string &prefix) const
    {
        auto last = scan_prefix(prefix, 0, 1, true);
        if (!last)
            return std::unexpected(last.error());
        if (last->empty())
            return std::optional<KeyValue>{};
        return std::optional<KeyValue>(std::move(last->front()));
    }

    const std::string &RocksDbStorage::path() const
    {
        return impl_->path;
    }

} // namespace attest
