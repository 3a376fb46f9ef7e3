#ifndef HTTP_CLIENT_H

#define HTTP_CLIENT_H

#include <boost/system/error_code.hpp>
#include <functional>
#include <string_view>
#include <vector>

class http_client {
	public:
		typedef std::function<void(const boost::system::error_code&)> on_error_callback;
		typedef std::function<void(std::vector<char> *body)> on_receive_callback;

		virtual ~http_client() = default;

		// Fetches a URL. Exactly one of the callbacks is invoked, never from
		// within this call. Responses with a status outside 2xx are errors.
		virtual void get(const std::string_view& url,
				 const on_receive_callback& on_receive,
				 const on_error_callback& on_error) = 0;
};

#endif // HTTP_CLIENT_H
