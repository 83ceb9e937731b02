#ifndef SEEDWISE_ERROR_CODE_HEADER
#define SEEDWISE_ERROR_CODE_HEADER

#include <system_error>

namespace seedwise {

// Use aliases so that adapters built on Boost.System can be wired in without
// touching the rest of the library.
using std::errc;
using std::error_category;
using std::error_code;
using std::error_condition;
using std::generic_category;
using std::is_error_code_enum;
using std::make_error_code;
using std::system_category;
using std::system_error;

} // seedwise

#endif // SEEDWISE_ERROR_CODE_HEADER
