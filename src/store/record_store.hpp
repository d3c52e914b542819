#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/types.hpp"
#include "util/logger.hpp"

namespace loanrecon {

// Immutable dataset plus indices, published as a unit.
// All three structures come from the same input batch. Pointers in
// key_index and mismatches refer into records and stay valid for the
// lifetime of the snapshot.
struct Snapshot {
    std::vector<LoanRecord> records;
    std::unordered_map<std::string, const LoanRecord*> key_index; // upper-cased key
    std::vector<const LoanRecord*> mismatches;                    // records order
    std::chrono::system_clock::time_point build_time{};
    uint64_t version = 0;          // 0 = nothing built yet
    size_t duplicate_keys = 0;     // keys replaced under last-write-wins

    bool loaded() const { return version != 0; }

    // Case-insensitive key lookup. Returns nullptr if absent.
    const LoanRecord* find(const std::string& key) const;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

// Owner of the active snapshot.
// Readers take a SnapshotPtr and keep using it while a rebuild runs;
// build() constructs the replacement off-lock and swaps the pointer.
class RecordStore {
public:
    explicit RecordStore(const Logger& logger);

    // Index records into a new snapshot and publish it.
    // Duplicate keys: the later record owns the key in the index.
    void build(std::vector<LoanRecord> records);

    SnapshotPtr snapshot() const;

    std::optional<LoanRecord> get_by_key(const std::string& key) const;

    // Records with nonzero difference, from the current snapshot.
    // Shares ownership of that snapshot, so the pointers outlive a rebuild.
    std::shared_ptr<const std::vector<const LoanRecord*>> mismatch_set() const;

    size_t count() const;
    std::chrono::system_clock::time_point last_build_time() const;
    uint64_t version() const;
    bool data_loaded() const;

private:
    const Logger& logger_;
    mutable std::mutex snapshot_mutex_;  // guards current_ swap only
    std::mutex build_mutex_;             // serializes writers
    SnapshotPtr current_;
    uint64_t next_version_ = 1;
};

} // namespace loanrecon
