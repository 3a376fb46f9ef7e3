#ifndef OUTPUT_NAMING_H

#define OUTPUT_NAMING_H

#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

// "<playlist name>_hls_segments", where the name is the playlist file name
// without extension or, if the URL has none, the host name.
void derive_output_directory(const std::string_view& playlist_url,
			     std::string *directory,
			     boost::system::error_code& ec);

// "<timestamp>_<index>_<segment file name>". The index is zero padded so that
// names sort in batch order.
void derive_segment_file_name(const std::string_view& timestamp,
			      size_t index,
			      const std::string_view& segment_url,
			      std::string *name,
			      boost::system::error_code& ec);

std::string format_timestamp(const std::chrono::system_clock::time_point& t);

#endif // OUTPUT_NAMING_H
