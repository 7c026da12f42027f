#pragma once

#include <filesystem>
#include <string>

namespace planwarden {

struct WrittenArtifact {
    std::string filename;
    std::filesystem::path path;
    std::string sha256; // digest of the bytes on disk after the write
};

// ArtifactStore: per-plan output directories under a single root.
//
// Layout: <root>/<plan_id>/<filename>. Writing the same name again
// overwrites it in place; there is no versioning.
class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path dir_for(const std::string& plan_id) const;

    // Creates the plan directory if needed, writes `content` verbatim and
    // hashes the file by reading it back. Returns empty string on success.
    std::string write(const std::string& plan_id,
                      const std::string& filename,
                      const std::string& content,
                      WrittenArtifact* out) const;

    bool exists(const std::string& plan_id, const std::string& filename) const;

private:
    std::filesystem::path root_;
};

} // namespace planwarden
