#pragma once

#include <datapod/datapod.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <shared_mutex>
#include <stdexcept>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include "kitty_store.hpp"

namespace kitties::storage {

    using namespace datapod;

    // ===========================================
    // On-disk records - POD structs with members()
    // ===========================================

    /// One stored kitty
    struct KittyRecord {
        String owner;
        u32 kitty_id = 0;
        Genome genome = {};
        i64 created_at = 0;

        auto members() { return std::tie(owner, kitty_id, genome, created_at); }
        auto members() const { return std::tie(owner, kitty_id, genome, created_at); }
    };

    /// Allocator counter snapshot
    struct MetaRecord {
        u32 next_kitty_id = 0;
        i64 updated_at = 0;

        auto members() { return std::tie(next_kitty_id, updated_at); }
        auto members() const { return std::tie(next_kitty_id, updated_at); }
    };

    // ===========================================
    // FileKittyStore - file-based kitty storage
    // ===========================================

    /// Directory holding `kitties.dat` (append-only, length-prefixed datapod
    /// records) and `meta.dat` (counter). The index is rebuilt on open.
    class FileKittyStore : public KittyStore {
      public:
        inline FileKittyStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        inline ~FileKittyStore() override { close(); }

        FileKittyStore(const FileKittyStore &) = delete;
        FileKittyStore &operator=(const FileKittyStore &) = delete;

        /// Open or create storage at given path (directory)
        inline Result<void, Error> open(const String &path, const OpenOptions &opts = OpenOptions{}) {
            std::unique_lock lock(mutex_);
            try {
                base_path_ = std::string(path.c_str());
                sync_mode_ = opts.sync_mode;

                std::filesystem::create_directories(base_path_);
                auto kitties_path = base_path_ / "kitties.dat";
                if (!std::filesystem::exists(kitties_path)) {
                    std::ofstream(kitties_path, std::ios::binary).close();
                }

                loadIndex();
                loadMeta();
                reconcileCounter();

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(Error::io_error(String(e.what())));
            }
        }

        /// Close storage; pending writes of an open transaction are dropped
        inline void close() {
            std::unique_lock lock(mutex_);
            if (is_open_) {
                clearPending();
                index_.clear();
                is_open_ = false;
            }
        }

        inline bool isOpen() const {
            std::shared_lock lock(mutex_);
            return is_open_;
        }

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class FileTxGuard : public TxGuard {
          public:
            inline explicit FileTxGuard(FileKittyStore &store) : store_(store), committed_(false) {
                std::unique_lock lock(store_.mutex_);
                store_.clearPending();
                store_.in_transaction_ = true;
            }

            inline ~FileTxGuard() override { rollback(); }

            FileTxGuard(const FileTxGuard &) = delete;
            FileTxGuard &operator=(const FileTxGuard &) = delete;

            inline Result<void, Error> commit() override {
                if (committed_)
                    return Result<void, Error>::ok();
                std::unique_lock lock(store_.mutex_);
                auto flushed = store_.flushPending();
                store_.clearPending();
                store_.in_transaction_ = false;
                committed_ = true;
                return flushed;
            }

            inline void rollback() override {
                if (committed_)
                    return;
                std::unique_lock lock(store_.mutex_);
                store_.clearPending();
                store_.in_transaction_ = false;
                committed_ = true;
            }

          private:
            FileKittyStore &store_;
            bool committed_;
        };

        inline std::unique_ptr<TxGuard> beginTransaction() override { return std::make_unique<FileTxGuard>(*this); }

        // ===========================================
        // KittyStore operations
        // ===========================================

        inline Optional<Kitty> get(const AccountId &owner, KittyId id) const override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return Optional<Kitty>();

            auto it = index_.find(Key(owner, id));
            if (it == index_.end())
                return Optional<Kitty>();

            auto record = readRecordAt(it->second);
            if (!record.has_value())
                return Optional<Kitty>();
            return Optional<Kitty>(Kitty(record->genome));
        }

        inline Result<void, Error> insert(const AccountId &owner, KittyId id, const Kitty &kitty) override {
            std::unique_lock lock(mutex_);
            if (!is_open_)
                return Result<void, Error>::err(store_not_open());
            if (!isValidAccount(owner))
                return Result<void, Error>::err(Error::invalid_argument("Owner must not contain NUL bytes"));

            KittyRecord record;
            record.owner = String(owner.c_str());
            record.kitty_id = id;
            record.genome = kitty.genome;
            record.created_at = currentTimestamp();

            if (in_transaction_) {
                pending_kitties_.push_back(record);
                return Result<void, Error>::ok();
            }
            return appendAndIndex(record);
        }

        inline std::vector<KittyEntry> kittiesOf(const AccountId &owner) const override {
            std::shared_lock lock(mutex_);
            std::vector<KittyEntry> result;
            if (!is_open_)
                return result;

            for (auto it = index_.lower_bound(Key(owner, 0)); it != index_.end() && it->first.first == owner; ++it) {
                auto record = readRecordAt(it->second);
                if (record.has_value())
                    result.push_back(KittyEntry{it->first.second, Kitty(record->genome)});
            }
            return result;
        }

        inline i64 count() const override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return 0;
            return static_cast<i64>(index_.size());
        }

        inline Result<KittyId, Error> nextId() const override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return Result<KittyId, Error>::err(store_not_open());
            return Result<KittyId, Error>::ok(next_id_);
        }

        inline Result<void, Error> setNextId(KittyId next_id) override {
            std::unique_lock lock(mutex_);
            if (!is_open_)
                return Result<void, Error>::err(store_not_open());

            if (in_transaction_) {
                pending_next_id_ = Optional<KittyId>(next_id);
                return Result<void, Error>::ok();
            }
            return writeMeta(next_id);
        }

        /// True when the data files are present
        inline Result<bool, Error> quickCheck() const {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return Result<bool, Error>::err(store_not_open());

            try {
                return Result<bool, Error>::ok(std::filesystem::exists(base_path_ / "kitties.dat"));
            } catch (const std::exception &e) {
                return Result<bool, Error>::err(Error::io_error(String(e.what())));
            }
        }

      private:
        using Key = std::pair<AccountId, KittyId>;

        // ===========================================
        // File I/O with datapod serialization
        // ===========================================

        inline Result<void, Error> appendAndIndex(const KittyRecord &record) {
            try {
                std::ofstream out(base_path_ / "kitties.dat", std::ios::binary | std::ios::app);
                if (!out)
                    return Result<void, Error>::err(store_failed("Failed to open kitties.dat for writing"));

                u64 offset = out.tellp();

                KittyRecord mutable_record = record;
                auto buffer = datapod::serialize(mutable_record);
                u32 len = static_cast<u32>(buffer.size());

                out.write(reinterpret_cast<const char *>(&len), sizeof(len));
                out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
                if (sync_mode_ == OpenOptions::Synchronous::FULL)
                    out.flush();
                if (!out)
                    return Result<void, Error>::err(store_failed("Failed to append kitty record"));

                index_[Key(std::string(record.owner.c_str()), record.kitty_id)] = offset;
                if (!highest_id_.has_value() || record.kitty_id > *highest_id_)
                    highest_id_ = Optional<KittyId>(record.kitty_id);
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(store_failed(String(e.what())));
            }
        }

        inline Optional<KittyRecord> readRecordAt(u64 offset) const {
            std::ifstream in(base_path_ / "kitties.dat", std::ios::binary);
            if (!in)
                return Optional<KittyRecord>();

            in.seekg(offset);

            u32 len;
            in.read(reinterpret_cast<char *>(&len), sizeof(len));
            if (!in)
                return Optional<KittyRecord>();

            ByteBuf data(len);
            in.read(reinterpret_cast<char *>(data.data()), len);
            if (!in)
                return Optional<KittyRecord>();

            return Optional<KittyRecord>(datapod::deserialize<Mode::NONE, KittyRecord>(data));
        }

        inline Result<void, Error> writeMeta(KittyId next_id) {
            try {
                auto tmp_path = base_path_ / "meta.dat.tmp";
                {
                    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
                    if (!out)
                        return Result<void, Error>::err(store_failed("Failed to open meta.dat for writing"));

                    MetaRecord meta;
                    meta.next_kitty_id = next_id;
                    meta.updated_at = currentTimestamp();
                    auto buffer = datapod::serialize(meta);
                    out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
                    out.flush();
                    if (!out)
                        return Result<void, Error>::err(store_failed("Failed to write meta.dat"));
                }
                std::filesystem::rename(tmp_path, base_path_ / "meta.dat");
                next_id_ = next_id;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(store_failed(String(e.what())));
            }
        }

        /// Apply buffered writes. On failure the log is truncated back and the
        /// index restored, so a failed commit leaves no kitty behind.
        inline Result<void, Error> flushPending() {
            auto kitties_path = base_path_ / "kitties.dat";
            std::uintmax_t saved_size = 0;
            try {
                saved_size = std::filesystem::file_size(kitties_path);
            } catch (const std::exception &e) {
                return Result<void, Error>::err(store_failed(String(e.what())));
            }
            auto saved_index = index_;
            auto saved_highest = highest_id_;

            auto flushed = appendPendingAndMeta();
            if (flushed.is_ok())
                return flushed;

            index_ = std::move(saved_index);
            highest_id_ = saved_highest;
            std::error_code ec;
            std::filesystem::resize_file(kitties_path, saved_size, ec);
            if (ec) {
                return Result<void, Error>::err(
                    store_failed(String(("Failed to undo partial commit: " + ec.message()).c_str())));
            }
            return flushed;
        }

        inline Result<void, Error> appendPendingAndMeta() {
            for (const auto &record : pending_kitties_) {
                auto appended = appendAndIndex(record);
                if (!appended.is_ok())
                    return appended;
            }
            if (pending_next_id_.has_value())
                return writeMeta(*pending_next_id_);
            return Result<void, Error>::ok();
        }

        inline void clearPending() {
            pending_kitties_.clear();
            pending_next_id_ = Optional<KittyId>();
        }

        // ===========================================
        // Index management
        // ===========================================

        inline void loadIndex() {
            index_.clear();
            highest_id_ = Optional<KittyId>();

            std::ifstream in(base_path_ / "kitties.dat", std::ios::binary);
            if (!in)
                return;

            while (in) {
                u64 record_offset = in.tellg();

                u32 len;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (!in)
                    break;

                ByteBuf data(len);
                in.read(reinterpret_cast<char *>(data.data()), len);
                if (!in)
                    break;

                auto record = datapod::deserialize<Mode::NONE, KittyRecord>(data);
                index_[Key(std::string(record.owner.c_str()), record.kitty_id)] = record_offset;
                if (!highest_id_.has_value() || record.kitty_id > *highest_id_)
                    highest_id_ = Optional<KittyId>(record.kitty_id);
            }
        }

        inline void loadMeta() {
            next_id_ = 0;

            auto meta_path = base_path_ / "meta.dat";
            if (!std::filesystem::exists(meta_path))
                return;

            std::ifstream in(meta_path, std::ios::binary);
            auto size = std::filesystem::file_size(meta_path);
            ByteBuf data(size);
            in.read(reinterpret_cast<char *>(data.data()), size);
            if (!in)
                throw std::runtime_error("Failed to read meta.dat");

            next_id_ = datapod::deserialize<Mode::NONE, MetaRecord>(data).next_kitty_id;
        }

        /// A commit interrupted between the kitty append and the meta write
        /// leaves the counter behind the log; never hand out a stored id again.
        inline void reconcileCounter() {
            if (!highest_id_.has_value() || *highest_id_ < next_id_)
                return;
            next_id_ = (*highest_id_ == std::numeric_limits<KittyId>::max()) ? *highest_id_ : *highest_id_ + 1;
        }

        // ===========================================
        // Member variables
        // ===========================================

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;

        std::map<Key, u64> index_;
        Optional<KittyId> highest_id_;
        KittyId next_id_ = 0;

        bool in_transaction_ = false;
        Vector<KittyRecord> pending_kitties_;
        Optional<KittyId> pending_next_id_;

        mutable std::shared_mutex mutex_;
    };

} // namespace kitties::storage
