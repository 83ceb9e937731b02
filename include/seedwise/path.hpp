#ifndef SEEDWISE_PATH_HEADER
#define SEEDWISE_PATH_HEADER

#if defined(SEEDWISE_USE_BOOST_FILESYSTEM)
# include <boost/filesystem/path.hpp>
namespace seedwise { using boost::filesystem::path; }
#elif __cplusplus >= 201703L
# include <filesystem>
namespace seedwise { using std::filesystem::path; }
#else
# error "Need boost or std filesystem support."
#endif

#endif // SEEDWISE_PATH_HEADER
