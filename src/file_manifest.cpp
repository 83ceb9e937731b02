#include "file_manifest.hpp"
#include "string_utils.hpp"

#include <algorithm>

namespace seedwise {

bytes_t file_manifest::total_length() const noexcept
{
    bytes_t total = 0;
    for(const auto& file : files_) { total += file.length; }
    return total;
}

std::vector<file_entry> file_manifest::canonical_files(const bool case_sensitive) const
{
    std::vector<file_entry> canonical = files_;
    for(auto& file : canonical)
    {
        std::replace(file.path.begin(), file.path.end(), '\\', '/');
        if(!case_sensitive) { util::to_lower(file.path); }
    }
    std::sort(canonical.begin(), canonical.end());
    canonical.erase(std::unique(canonical.begin(), canonical.end()), canonical.end());
    return canonical;
}

sha256_hash file_manifest::fingerprint(const bool case_sensitive) const
{
    sha256_hasher hasher;
    for(const auto& file : canonical_files(case_sensitive))
    {
        hasher.update(file.path);
        hasher.update(" " + std::to_string(file.length));
        // '\0' can't appear in a path, so lines can't run into each other
        hasher.update("\0", 1);
    }
    return hasher.finish();
}

} // namespace seedwise
