#include "../include/lock_store.hpp"
#include "../include/common.hpp"
#include "../include/rules.hpp"
#include "../include/symbols.hh"

#include <lithium_json.hh>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using std::ios;

FileLockStore::FileLockStore(fs::path lockPath) : lockPath(std::move(lockPath)) {}

string encode_lock_record(const LockRecord &record) {
    return li::json_encode(li::mmm(s::pid = record.ownerPid,
                                   s::version = record.protocolVersion,
                                   s::port = static_cast<int>(record.servicePort),
                                   s::timestamp = static_cast<int64_t>(record.writtenAtMs)));
}

std::optional<LockRecord> decode_lock_record(const string &raw) {
    string input = trim(raw);
    if (input.empty()) {
        return std::nullopt;
    }

    auto parsed = li::mmm(s::pid = int64_t(0),
                          s::version = string(),
                          s::port = int(0),
                          s::timestamp = int64_t(0));
    auto err = li::json_decode(input, parsed);
    if (err.bad()) {
        return std::nullopt;
    }

    if (parsed.pid <= 0 || parsed.version.empty() ||
        parsed.port <= 0 || parsed.port > Consts::MAX_PORT_NUMBER || parsed.timestamp < 0) {
        return std::nullopt;
    }

    LockRecord record;
    record.ownerPid        = parsed.pid;
    record.protocolVersion = parsed.version;
    record.servicePort     = static_cast<uint16_t>(parsed.port);
    record.writtenAtMs     = static_cast<uint64_t>(parsed.timestamp);
    return record;
}

bool same_lock_record(const LockRecord &a, const LockRecord &b) {
    return a.ownerPid == b.ownerPid && a.protocolVersion == b.protocolVersion &&
           a.servicePort == b.servicePort && a.writtenAtMs == b.writtenAtMs;
}

fs::path default_lock_path(uint16_t servicePort) {
    return fs::temp_directory_path() / (string(LOCK_FILE_PREFIX) + std::to_string(servicePort) + ".lock");
}

// Shared by Read() and RemoveIfMatches(): absent -> empty, malformed -> WARN + empty.
static std::optional<LockRecord> read_lock_file(const fs::path &path) {
    std::ifstream in(path, ios::in | ios::binary);
    if (!in.is_open()) {
        // Absent is normal; anything else (EACCES, ENOTDIR...) is fatal.
        std::error_code ec;
        bool exists = fs::exists(path, ec);
        if (ec) {
            throw std::runtime_error("Cannot stat lock file " + path.string() + ": " + ec.message());
        }
        if (!exists) {
            return std::nullopt;
        }
        throw std::runtime_error("Cannot read lock file " + path.string() + ": " + std::strerror(errno));
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("I/O error while reading lock file " + path.string());
    }

    auto record = decode_lock_record(buffer.str());
    if (!record) {
        log_line(LogLevel::WARN, "Ignoring malformed lock file " + path.string());
    }
    return record;
}

std::optional<LockRecord> FileLockStore::Read() {
    return read_lock_file(this->lockPath);
}

void FileLockStore::Write(const LockRecord &record) {
    std::error_code ec;
    fs::path parent = this->lockPath.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Cannot create lock directory " + parent.string() + ": " + ec.message());
        }
    }

    // Temp file is per-process so two writers never share one.
    fs::path tmpPath = this->lockPath;
    tmpPath += ".tmp." + std::to_string(::getpid());

    {
        std::ofstream out(tmpPath, ios::out | ios::trunc | ios::binary);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot create lock file " + tmpPath.string() + ": " + std::strerror(errno));
        }
        out << encode_lock_record(record) << "\n";
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tmpPath, ec);
            throw std::runtime_error("Failed to write lock file " + tmpPath.string());
        }
    }

    fs::rename(tmpPath, this->lockPath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw std::runtime_error("Cannot replace lock file " + this->lockPath.string() + ": " + ec.message());
    }
}

void FileLockStore::Remove() {
    std::error_code ec;
    fs::remove(this->lockPath, ec);
    if (ec) {
        throw std::runtime_error("Cannot remove lock file " + this->lockPath.string() + ": " + ec.message());
    }
}

bool FileLockStore::RemoveIfMatches(const LockRecord &expected) {
    // Move the record out of the way first: nobody can replace what we compare.
    fs::path claimPath = this->lockPath;
    claimPath += ".claim." + std::to_string(::getpid());

    std::error_code ec;
    fs::rename(this->lockPath, claimPath, ec);
    if (ec == std::errc::no_such_file_or_directory) {
        return false;
    }
    if (ec) {
        throw std::runtime_error("Cannot claim lock file " + this->lockPath.string() + ": " + ec.message());
    }

    std::optional<LockRecord> claimed;
    try {
        claimed = read_lock_file(claimPath);
    } catch (const std::exception &) {
        std::error_code ignored;
        fs::rename(claimPath, this->lockPath, ignored);
        throw;
    }

    if (claimed && same_lock_record(*claimed, expected)) {
        fs::remove(claimPath, ec);
        if (ec) {
            throw std::runtime_error("Cannot remove lock file " + claimPath.string() + ": " + ec.message());
        }
        return true;
    }

    // Someone else's record: put it back, unless an even newer one took its place (link never overwrites).
    if (::link(claimPath.c_str(), this->lockPath.c_str()) != 0 && errno != EEXIST) {
        int linkErr = errno;
        std::error_code ignored;
        fs::remove(claimPath, ignored);
        throw std::runtime_error("Cannot restore lock file " + this->lockPath.string() + ": " + std::strerror(linkErr));
    }
    fs::remove(claimPath, ec);
    if (ec) {
        log_line(LogLevel::WARN, "Leftover lock claim " + claimPath.string() + ": " + ec.message());
    }
    return false;
}
