#include "planwarden/audit.h"
#include "planwarden/json_util.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace planwarden {

std::string iso_now_ms() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

AuditEntry make_audit_entry(std::string kind, std::string plan_id) {
    AuditEntry e;
    e.timestamp = iso_now_ms();
    e.kind = std::move(kind);
    e.plan_id = std::move(plan_id);
    return e;
}

static bool needs_quoting(const std::string& v) {
    if (v.empty()) return true;
    for (unsigned char c : v) {
        if (c <= 0x20 || c == '"' || c == '=' || c == 0x7f) return true;
    }
    return false;
}

std::string AuditEntry::format() const {
    std::ostringstream oss;
    oss << "[" << timestamp << "] " << kind;
    if (!plan_id.empty()) oss << " plan_id=" << plan_id;
    for (const auto& kv : fields) {
        oss << " " << kv.first << "=";
        if (needs_quoting(kv.second)) oss << json_quote(kv.second);
        else oss << kv.second;
    }
    return oss.str();
}

// ---- FileAuditLog ----

FileAuditLog::FileAuditLog(std::filesystem::path path, bool fsync)
    : path_(std::move(path)), fsync_(fsync) {}

std::string FileAuditLog::append(const AuditEntry& e) {
    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }

    int fd = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) return std::string("open: ") + std::strerror(errno);

    std::string line = e.format();
    line.push_back('\n');

    // O_APPEND: each write lands at the current end of file
    const char* p = line.data();
    size_t remaining = line.size();
    while (remaining > 0) {
        ssize_t w = ::write(fd, p, remaining);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string err = std::string("write: ") + std::strerror(errno);
            ::close(fd);
            return err;
        }
        p += w;
        remaining -= (size_t)w;
    }

    if (fsync_ && ::fsync(fd) != 0) {
        std::string err = std::string("fsync: ") + std::strerror(errno);
        ::close(fd);
        return err;
    }
    if (::close(fd) != 0) return std::string("close: ") + std::strerror(errno);
    return "";
}

// ---- MemoryAuditLog ----

std::string MemoryAuditLog::append(const AuditEntry& e) {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.push_back(e);
    return "";
}

std::vector<std::string> MemoryAuditLog::lines() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.format());
    return out;
}

std::vector<AuditEntry> MemoryAuditLog::entries() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_;
}

} // namespace planwarden
