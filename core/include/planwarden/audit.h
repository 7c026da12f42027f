#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace planwarden {

// One lifecycle event. Formatted as a single line:
//   [2026-01-01T00:00:00.000Z] STEP 01 plan_id=P1 output=... hash=...
struct AuditEntry {
    std::string timestamp; // ISO-8601 UTC, millisecond precision
    std::string kind;      // "START", "ATTEST ok", "ATTEST fail", "STEP 01", "END", ...
    std::string plan_id;
    std::vector<std::pair<std::string, std::string>> fields;

    AuditEntry& with(std::string key, std::string value) {
        fields.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    // Line without the trailing newline.
    std::string format() const;
};

// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string iso_now_ms();

// Entry stamped with iso_now_ms().
AuditEntry make_audit_entry(std::string kind, std::string plan_id);

// Destination for audit entries. Entries are only ever appended; a sink
// never rewrites or drops what it has accepted.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    // Returns empty string on success.
    virtual std::string append(const AuditEntry& e) = 0;
};

// Append-only text log on disk. Each append opens the file with O_APPEND,
// writes exactly one line, optionally fsyncs and closes it again, so a
// crash leaves every completed entry readable.
class FileAuditLog : public AuditSink {
public:
    explicit FileAuditLog(std::filesystem::path path, bool fsync = false);

    std::string append(const AuditEntry& e) override;
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    bool fsync_;
};

// In-memory sink for tests and dry runs.
class MemoryAuditLog : public AuditSink {
public:
    std::string append(const AuditEntry& e) override;

    std::vector<std::string> lines() const;
    std::vector<AuditEntry> entries() const;

private:
    mutable std::mutex mu_;
    std::vector<AuditEntry> entries_;
};

} // namespace planwarden
