#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

#include "error.h"
#include "segment_identity.h"
#include "url.h"

static const char identity_delimiter = '_';

static bool numeric_suffix(const std::string_view& name, std::string *number)
{
	const auto it = std::find_if(name.rbegin(), name.rend(), [](char c) {
		return !std::isdigit(static_cast<unsigned char>(c));
	});
	const auto digits = name.substr(name.size() - (it - name.rbegin()));
	uint64_t value = 0;

	if (digits.empty() ||
	    std::from_chars(digits.data(), digits.data() + digits.size(), value).ec != std::errc {})
		return false;

	*number = std::to_string(value);
	return true;
}

void derive_segment_identity(const std::string_view& url,
			     size_t sequence,
			     size_t index,
			     std::string *identity,
			     boost::system::error_code& ec)
{
	url_parts parts;
	std::string basename;

	if (!parse_url(url, &parts) || !path_basename(parts, &basename)) {
		ec = errc::invalid_url;
		return;
	}

	if (basename.empty() || basename == "." || basename == "/") {
		ec = errc::invalid_filename;
		return;
	}

	if (!numeric_suffix(strip_extension(basename), identity)) {
		*identity = std::to_string(sequence);
		identity->push_back(identity_delimiter);
		identity->append(std::to_string(index));
	}

	ec = {};
}
