#ifndef ERROR_H

#define ERROR_H

#include <boost/system/error_code.hpp>
#include <type_traits>

enum class errc {
	unrecognized_format = 1,
	invalid_url,
	invalid_filename,
	bad_status,
	exhausted_retries,
	no_media_playlist,
	too_many_redirects,
	invalid_output_directory
};

const boost::system::error_category& hls_category() noexcept;

inline boost::system::error_code make_error_code(errc e) noexcept
{
	return {static_cast<int>(e), hls_category()};
}

namespace boost {
namespace system {

template<> struct is_error_code_enum<::errc> : std::true_type {
};

} // namespace system
} // namespace boost

#endif // ERROR_H
