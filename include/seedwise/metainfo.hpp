#ifndef SEEDWISE_METAINFO_HEADER
#define SEEDWISE_METAINFO_HEADER

#include "file_manifest.hpp"
#include "error_code.hpp"

#include <type_traits> // true_type
#include <string>

namespace seedwise {

enum class metainfo_errc
{
    unknown = 1,
    // The input is not valid bencoding, or its top level element is not a map.
    invalid_bencoding,
    // There is no 'info' map.
    missing_info,
    // There is no 'name' string in the info map.
    missing_name,
    // A file in a multi-file torrent has no valid 'length' or 'path', or a
    // single-file torrent has no valid 'length'.
    invalid_file_entry
};

struct metainfo_error_category : public std::error_category
{
    const char* name() const noexcept override { return "metainfo"; }
    std::string message(int env) const override;
    std::error_condition default_error_condition(int ev) const noexcept override;
};

const metainfo_error_category& metainfo_category();
std::error_code make_error_code(metainfo_errc e);
std::error_condition make_error_condition(metainfo_errc e);

/**
 * Extracts the file list of a bencoded .torrent (metainfo) file. A single-file
 * torrent yields one entry named after 'info.name', in a multi-file torrent each
 * file is at 'name/<path elements joined by '/'>'.
 *
 * On error, `error` is set and an empty (unknown) manifest is returned.
 */
file_manifest decode_manifest(const std::string& encoded, error_code& error);

} // namespace seedwise

namespace std
{
    template<> struct is_error_code_enum<seedwise::metainfo_errc> : public true_type {};
}

#endif // SEEDWISE_METAINFO_HEADER
