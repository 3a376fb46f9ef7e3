#ifndef CONNECTION_POOL_H

#define CONNECTION_POOL_H

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/log/trivial.hpp>
#include <cstddef>
#include <list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "http_client.h"

namespace asio = boost::asio;
namespace http = boost::beast::http;
namespace ssl = asio::ssl;

class connection;

// Keep-alive HTTP/1.1 client over plain TCP or TLS, with a bounded number of
// connections per host. Requests beyond the bound wait for a free connection.
class connection_pool : public http_client {
		struct request {
			std::string url;
			std::string host;
			std::string resource;
			on_receive_callback on_receive;
			on_error_callback on_error;
			size_t redirect_number = 0;
			bool is_https = false;
		};

		std::unordered_map<std::string, std::list<std::shared_ptr<connection>>> connections;
		std::unordered_map<std::string, size_t> num_connections;
		std::unordered_map<std::string, std::list<request>> requests;
		asio::ip::tcp::resolver resolver;
		ssl::context tls_context;
		asio::io_context * const io = nullptr;
		const size_t max_connections = 0;
		size_t sequence_number = 0;

		void get(request&& r, size_t retry_number = 0);
		void get(const std::string_view& url,
			 const on_receive_callback& on_receive,
			 const on_error_callback& on_error,
			 size_t redirect_number);
		void next_request(const std::string& host);
		void on_response(const request& r, http::response<http::vector_body<char>> *response);

	public:
		connection_pool(asio::io_context *io_ctx, size_t max_host_connections) :
		    resolver(*io_ctx), tls_context(ssl::context::tlsv12_client), io(io_ctx),
		    max_connections(max_host_connections ? max_host_connections : 1)
		{
			boost::system::error_code ec;

			tls_context.set_default_verify_paths(ec);
			tls_context.set_verify_mode(ssl::verify_peer);

			if (ec)
				BOOST_LOG_TRIVIAL(error)
				    << "Unable to set the default paths for TLS verification.";
		}

		void get(const std::string_view& url,
			 const on_receive_callback& on_receive,
			 const on_error_callback& on_error) override;

		// Splits an http or https URL into "host:port" and the request target.
		static bool parse_url(const std::string_view& url,
				      bool *is_https,
				      std::string *host,
				      std::string *resource);
};

#endif // CONNECTION_POOL_H
