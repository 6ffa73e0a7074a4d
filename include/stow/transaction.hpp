#pragma once

#include <stow/result.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stow {

// All-or-nothing wrapper around a set of filesystem mutations.
//
// Every mutation made through the transaction appends an undo record. The
// persisted records named at construction are snapshotted up front. On
// commit() the log is discarded; on rollback(), or destruction without
// commit, the log is replayed in reverse and the records restored.
class Transaction {
public:
    enum class Op { Created, Overwritten, Removed, CreatedDir, RemovedDir };

    struct UndoRecord {
        Op op;
        std::filesystem::path path;
        std::string prior;          // content before Overwritten/Removed
    };

    explicit Transaction(std::vector<std::filesystem::path> records = {});
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // Snapshot the persisted records. Must succeed before any mutation.
    Status begin();

    // Atomic write of `content`, creating parent directories.
    Status write_file(const std::filesystem::path& path, const std::string& content);

    // Remove a file; absent files are not an error.
    Status remove_file(const std::filesystem::path& path);

    // Create dir and any missing parents.
    Status create_directories(const std::filesystem::path& dir);

    // Remove an empty directory created outside the transaction's own log,
    // restoring it on rollback.
    Status remove_empty_dir(const std::filesystem::path& dir);

    // Transactional fsutil::prune_empty_dirs: remove empty directories from
    // start upward, stopping at root or any path in keep.
    Status prune_empty_dirs(const std::filesystem::path& start,
                            const std::filesystem::path& root,
                            const std::set<std::filesystem::path>& keep);

    void commit();
    Status rollback();

    bool is_committed() const { return committed_; }
    bool is_rolled_back() const { return rolled_back_; }
    const std::vector<UndoRecord>& log() const { return log_; }

    // Open a transaction over `records`, run op, commit on success and roll
    // back otherwise. The operation's error is returned after rollback.
    static Status run(std::vector<std::filesystem::path> records,
                      const std::function<Status(Transaction&)>& op);

private:
    struct RecordSnapshot {
        std::filesystem::path path;
        std::optional<std::string> content;     // nullopt: did not exist
    };

    std::vector<std::filesystem::path> record_paths_;
    std::vector<RecordSnapshot> snapshots_;
    std::vector<UndoRecord> log_;
    bool begun_ = false;
    bool committed_ = false;
    bool rolled_back_ = false;

    Status ensure_parent(const std::filesystem::path& path);
};

} // namespace stow
