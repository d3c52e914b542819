#include "store/record_store.hpp"

#include "util/string_utils.hpp"

namespace loanrecon {

const LoanRecord* Snapshot::find(const std::string& key) const {
    auto it = key_index.find(to_upper(key));
    if (it == key_index.end()) return nullptr;
    return it->second;
}

RecordStore::RecordStore(const Logger& logger)
    : logger_(logger), current_(std::make_shared<Snapshot>()) {}

void RecordStore::build(std::vector<LoanRecord> records) {
    std::lock_guard<std::mutex> build_lock(build_mutex_);

    auto start = std::chrono::steady_clock::now();
    auto snap = std::make_shared<Snapshot>();
    snap->records = std::move(records);

    // records is not resized past this point; element addresses are stable
    snap->key_index.reserve(snap->records.size());
    for (const auto& rec : snap->records) {
        auto res = snap->key_index.emplace(to_upper(rec.loan_id), &rec);
        if (!res.second) {
            logger_.debug("Duplicate LoanID %s, later record wins",
                          rec.loan_id.c_str());
            res.first->second = &rec;
            snap->duplicate_keys++;
        }
        if (rec.has_mismatch()) {
            snap->mismatches.push_back(&rec);
        }
    }

    snap->build_time = std::chrono::system_clock::now();
    snap->version = next_version_++;

    if (snap->duplicate_keys > 0) {
        logger_.warn("%zu duplicate LoanID(s) replaced (last record wins)",
                     snap->duplicate_keys);
    }

    size_t total = snap->records.size();
    size_t mismatches = snap->mismatches.size();
    uint64_t version = snap->version;

    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        current_ = std::move(snap);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger_.info("Built snapshot v%lu: %zu records, %zu mismatches (%lld ms)",
                 static_cast<unsigned long>(version), total, mismatches,
                 static_cast<long long>(elapsed));
}

SnapshotPtr RecordStore::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return current_;
}

std::optional<LoanRecord> RecordStore::get_by_key(const std::string& key) const {
    auto snap = snapshot();
    const LoanRecord* rec = snap->find(key);
    if (!rec) return std::nullopt;
    return *rec;
}

std::shared_ptr<const std::vector<const LoanRecord*>> RecordStore::mismatch_set() const {
    auto snap = snapshot();
    return std::shared_ptr<const std::vector<const LoanRecord*>>(snap, &snap->mismatches);
}

size_t RecordStore::count() const {
    return snapshot()->records.size();
}

std::chrono::system_clock::time_point RecordStore::last_build_time() const {
    return snapshot()->build_time;
}

uint64_t RecordStore::version() const {
    return snapshot()->version;
}

bool RecordStore::data_loaded() const {
    return !snapshot()->records.empty();
}

} // namespace loanrecon
