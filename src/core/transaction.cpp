#include <stow/transaction.hpp>
#include <stow/fsutil.hpp>
#include <stow/log.hpp>

namespace fs = std::filesystem;

namespace stow {

Transaction::Transaction(std::vector<fs::path> records)
    : record_paths_(std::move(records)) {}

Transaction::~Transaction() {
    if (begun_ && !committed_ && !rolled_back_) {
        auto s = rollback();
        if (s.is_err()) {
            log::error("rollback incomplete: %s", s.error().message.c_str());
        }
    }
}

Status Transaction::begin() {
    if (begun_) return ok_status();
    for (const auto& p : record_paths_) {
        std::error_code ec;
        RecordSnapshot snap;
        snap.path = p;
        if (fs::exists(p, ec)) {
            auto content = fsutil::read_file(p);
            if (content.is_err()) return std::move(content).error();
            snap.content = std::move(content).value();
        }
        snapshots_.push_back(std::move(snap));
    }
    begun_ = true;
    return ok_status();
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

Status Transaction::ensure_parent(const fs::path& path) {
    fs::path parent = path.parent_path();
    if (parent.empty()) return ok_status();
    return create_directories(parent);
}

Status Transaction::create_directories(const fs::path& dir) {
    STOW_TRY(begin());

    std::vector<fs::path> missing;
    std::error_code ec;
    for (fs::path p = dir; !p.empty() && !fs::exists(p, ec); p = p.parent_path()) {
        missing.push_back(p);
        if (p == p.parent_path()) break;
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        fs::create_directory(*it, ec);
        if (ec) {
            return StowError{StowError::IO,
                "cannot create directory " + it->string() + ": " + ec.message()};
        }
        log_.push_back(UndoRecord{Op::CreatedDir, *it, ""});
    }
    return ok_status();
}

Status Transaction::write_file(const fs::path& path, const std::string& content) {
    STOW_TRY(begin());
    STOW_TRY(ensure_parent(path));

    std::error_code ec;
    UndoRecord rec{Op::Created, path, ""};
    if (fs::exists(path, ec)) {
        auto prior = fsutil::read_file(path);
        if (prior.is_err()) return std::move(prior).error();
        rec.op = Op::Overwritten;
        rec.prior = std::move(prior).value();
    }

    STOW_TRY(fsutil::write_file_atomic(path, content));
    log_.push_back(std::move(rec));
    return ok_status();
}

Status Transaction::remove_file(const fs::path& path) {
    STOW_TRY(begin());

    std::error_code ec;
    if (!fs::exists(path, ec)) return ok_status();

    auto prior = fsutil::read_file(path);
    if (prior.is_err()) return std::move(prior).error();

    fs::remove(path, ec);
    if (ec) {
        return StowError{StowError::IO,
            "cannot remove " + path.string() + ": " + ec.message()};
    }
    log_.push_back(UndoRecord{Op::Removed, path, std::move(prior).value()});
    return ok_status();
}

Status Transaction::remove_empty_dir(const fs::path& dir) {
    STOW_TRY(begin());

    std::error_code ec;
    if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec)) return ok_status();
    fs::remove(dir, ec);
    if (ec) {
        return StowError{StowError::IO,
            "cannot remove directory " + dir.string() + ": " + ec.message()};
    }
    log_.push_back(UndoRecord{Op::RemovedDir, dir, ""});
    return ok_status();
}

Status Transaction::prune_empty_dirs(const fs::path& start, const fs::path& root,
                                     const std::set<fs::path>& keep) {
    fs::path root_norm = root.lexically_normal();
    fs::path dir = start.lexically_normal();
    std::error_code ec;

    while (!dir.empty() && dir != root_norm && !keep.count(dir)) {
        auto rel = dir.lexically_relative(root_norm);
        if (rel.empty() || *rel.begin() == "..") break;
        if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec)) break;
        STOW_TRY(remove_empty_dir(dir));
        dir = dir.parent_path();
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

void Transaction::commit() {
    committed_ = true;
    log_.clear();
    snapshots_.clear();
}

Status Transaction::rollback() {
    if (committed_ || rolled_back_) return ok_status();
    rolled_back_ = true;

    std::string failures;
    auto note = [&](const std::string& what) {
        log::error("rollback: %s", what.c_str());
        if (failures.empty()) failures = what;
    };

    log::info("rolling back %zu change(s)", log_.size());
    for (auto it = log_.rbegin(); it != log_.rend(); ++it) {
        std::error_code ec;
        switch (it->op) {
            case Op::Created:
                fs::remove(it->path, ec);
                if (ec) note("cannot remove " + it->path.string() + ": " + ec.message());
                break;
            case Op::Overwritten: {
                auto s = fsutil::write_file_atomic(it->path, it->prior);
                if (s.is_err()) note(s.error().message);
                break;
            }
            case Op::Removed: {
                auto s = fsutil::write_file_atomic(it->path, it->prior);
                if (s.is_err()) note(s.error().message);
                break;
            }
            case Op::RemovedDir:
                fs::create_directories(it->path, ec);
                if (ec) note("cannot recreate " + it->path.string() + ": " + ec.message());
                break;
            case Op::CreatedDir:
                // Only if the rollback emptied it
                if (fs::is_directory(it->path, ec) && fs::is_empty(it->path, ec)) {
                    fs::remove(it->path, ec);
                    if (ec) note("cannot remove " + it->path.string() + ": " + ec.message());
                }
                break;
        }
    }
    log_.clear();

    for (const auto& snap : snapshots_) {
        std::error_code ec;
        if (snap.content) {
            auto s = fsutil::write_file_atomic(snap.path, *snap.content);
            if (s.is_err()) note(s.error().message);
        } else if (fs::exists(snap.path, ec)) {
            fs::remove(snap.path, ec);
            if (ec) note("cannot remove " + snap.path.string() + ": " + ec.message());
        }
    }
    snapshots_.clear();

    if (!failures.empty()) {
        return StowError{StowError::IO, "rollback incomplete: " + failures,
            "inspect the workspace; some changes could not be undone"};
    }
    return ok_status();
}

Status Transaction::run(std::vector<fs::path> records,
                        const std::function<Status(Transaction&)>& op) {
    Transaction tx(std::move(records));
    STOW_TRY(tx.begin());

    auto result = op(tx);
    if (result.is_err()) {
        auto rb = tx.rollback();
        if (rb.is_err()) {
            auto err = std::move(result).error();
            err.hint = rb.error().message;
            return err;
        }
        return result;
    }
    tx.commit();
    return ok_status();
}

} // namespace stow
