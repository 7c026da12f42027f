#include "planwarden/artifacts.h"
#include "planwarden/crypto.h"
#include "planwarden/plan.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace planwarden {

ArtifactStore::ArtifactStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path ArtifactStore::dir_for(const std::string& plan_id) const {
    return root_ / plan_id;
}

std::string ArtifactStore::write(const std::string& plan_id,
                                 const std::string& filename,
                                 const std::string& content,
                                 WrittenArtifact* out) const {
    if (!is_safe_path_component(plan_id)) return "invalid plan id for artifact path: " + plan_id;
    if (!is_safe_path_component(filename)) return "invalid artifact name: " + filename;

    const auto dir = dir_for(plan_id);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return "create_directories " + dir.string() + ": " + ec.message();

    const auto path = dir / filename;
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return "open " + path.string() + ": " + std::strerror(errno);

    const char* p = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t w = ::write(fd, p, remaining);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string err = "write " + path.string() + ": " + std::strerror(errno);
            ::close(fd);
            return err;
        }
        p += w;
        remaining -= (size_t)w;
    }
    if (::close(fd) != 0) return "close " + path.string() + ": " + std::strerror(errno);

    // Hash what is on disk now, not the in-memory buffer.
    std::string digest = sha256_hex_file(path);
    if (digest.empty()) return "cannot read back " + path.string();

    if (out) {
        out->filename = filename;
        out->path = path;
        out->sha256 = digest;
    }
    return "";
}

bool ArtifactStore::exists(const std::string& plan_id, const std::string& filename) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(dir_for(plan_id) / filename, ec);
}

} // namespace planwarden
