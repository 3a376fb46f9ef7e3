#include <string>

#include "error.h"

namespace {

class hls_error_category : public boost::system::error_category {
	public:
		const char *name() const noexcept override
		{
			return "hls";
		}

		std::string message(int ev) const override
		{
			switch (static_cast<errc>(ev)) {
			case errc::unrecognized_format:
				return "Unrecognized playlist format";
			case errc::invalid_url:
				return "Invalid URL";
			case errc::invalid_filename:
				return "Invalid file name";
			case errc::bad_status:
				return "Unsuccessful HTTP status";
			case errc::exhausted_retries:
				return "Maximum number of attempts reached";
			case errc::no_media_playlist:
				return "No media playlist in master playlist";
			case errc::too_many_redirects:
				return "Too many redirects";
			case errc::invalid_output_directory:
				return "Unable to derive the output directory";
			}

			return "Unknown error";
		}
};

} // namespace

const boost::system::error_category& hls_category() noexcept
{
	static const hls_error_category category {};

	return category;
}
