#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

using std::string;
namespace fs = std::filesystem;

// Who currently claims to be the main instance, and where it listens.
// writtenAtMs is informational; staleness is decided by process liveness only.
struct LockRecord {
    int64_t  ownerPid{0};
    string   protocolVersion;
    uint16_t servicePort{0};
    uint64_t writtenAtMs{0};
};

/**
 * LockStore - access to the single lock record shared by all instances
 *
 * Read() returns an empty optional when there is no usable record.
 * Write() replaces the record atomically. Remove() is idempotent.
 * RemoveIfMatches() deletes the record only while it still equals expected,
 * so a record published by a newer main survives; returns whether it deleted.
 * Filesystem failures throw std::runtime_error: a process that cannot use
 * the lock location cannot take part in coordination.
 */
class LockStore {
public:
    virtual ~LockStore() = default;

    virtual std::optional<LockRecord> Read() = 0;
    virtual void Write(const LockRecord &record) = 0;
    virtual void Remove() = 0;
    virtual bool RemoveIfMatches(const LockRecord &expected) = 0;
};

// Lock record kept as a JSON file, replaced through write-temp-then-rename.
class FileLockStore : public LockStore {
private:
    fs::path lockPath;

public:
    explicit FileLockStore(fs::path lockPath);

    std::optional<LockRecord> Read() override;
    void Write(const LockRecord &record) override;
    void Remove() override;
    bool RemoveIfMatches(const LockRecord &expected) override;

    const fs::path &Path() const { return lockPath; }
};

// <temp dir>/taskpilot-<port>.lock
fs::path default_lock_path(uint16_t servicePort);

// Field-for-field equality; two writes of the same owner differ by writtenAtMs.
bool same_lock_record(const LockRecord &a, const LockRecord &b);

string encode_lock_record(const LockRecord &record);
// Empty optional for anything that is not a complete, sane record.
std::optional<LockRecord> decode_lock_record(const string &raw);
