#ifndef SEGMENT_IDENTITY_H

#define SEGMENT_IDENTITY_H

#include <boost/system/error_code.hpp>
#include <cstddef>
#include <string>
#include <string_view>

// Derives the deduplication key of a media segment: the numeric suffix of its
// file name if there is one, "<sequence>_<index>" otherwise.
void derive_segment_identity(const std::string_view& url,
			     size_t sequence,
			     size_t index,
			     std::string *identity,
			     boost::system::error_code& ec);

#endif // SEGMENT_IDENTITY_H
