#ifndef SEEDWISE_FILE_MANIFEST_HEADER
#define SEEDWISE_FILE_MANIFEST_HEADER

#include "sha256_hasher.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace seedwise {

struct file_entry
{
    // Relative to the torrent's save path and, for multi-file torrents, including
    // the root directory name.
    std::string path;
    // In bytes.
    bytes_t length = 0;

    file_entry() = default;
    file_entry(std::string p, bytes_t l)
        : path(std::move(p))
        , length(l)
    {}
};

inline bool operator==(const file_entry& a, const file_entry& b) noexcept
{
    return a.path == b.path && a.length == b.length;
}

inline bool operator!=(const file_entry& a, const file_entry& b) noexcept
{
    return !(a == b);
}

inline bool operator<(const file_entry& a, const file_entry& b) noexcept
{
    if(a.path == b.path) { return a.length < b.length; }
    return a.path < b.path;
}

/**
 * The payload description of a torrent: every file with its size. This, not any
 * tracker-assigned id or info hash (private trackers rewrite the info dictionary),
 * is what decides whether two torrents are the same content.
 *
 * A torrent always has at least one file, so an empty manifest stands for one that
 * is not known (yet), e.g. a remote candidate whose details were not fetched.
 */
class file_manifest
{
    std::vector<file_entry> files_;

public:

    file_manifest() = default;
    explicit file_manifest(std::vector<file_entry> files) : files_(std::move(files)) {}

    bool is_known() const noexcept { return !files_.empty(); }
    int num_files() const noexcept { return files_.size(); }
    const std::vector<file_entry>& files() const noexcept { return files_; }

    void add_file(std::string path, const bytes_t length)
    {
        files_.emplace_back(std::move(path), length);
    }

    bytes_t total_length() const noexcept;

    /**
     * Returns the files as a canonical set: backslashes turned into forward slashes,
     * lower-cased unless `case_sensitive`, sorted and deduplicated. Two manifests
     * describe the same content iff their canonical sets are equal.
     */
    std::vector<file_entry> canonical_files(const bool case_sensitive = true) const;

    /**
     * A SHA-256 digest over the canonical set, one "path length" line per file.
     * Equal canonical sets always produce equal fingerprints, so this is used to
     * bucket manifests before comparing them.
     */
    sha256_hash fingerprint(const bool case_sensitive = true) const;
};

} // namespace seedwise

#endif // SEEDWISE_FILE_MANIFEST_HEADER
