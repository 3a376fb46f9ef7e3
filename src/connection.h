#ifndef CONNECTION_H

#define CONNECTION_H

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <openssl/ssl.h>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = asio::ssl;
using tcp = boost::asio::ip::tcp;

static const unsigned http_version = 11;
static const char port_delimiter = ':';
static const std::chrono::seconds timeout {30};
static const char user_agent[] =
    "Mozilla/5.0 (X11; Ubuntu; Linux x86_64; rv:69.0) Gecko/20100101 Firefox/69.0";

typedef http::response<http::vector_body<char>> http_response;

class connection : public std::enable_shared_from_this<connection> {
	public:
		typedef std::function<void(const std::string&, const beast::error_code&)>
		    on_error_callback;
		typedef std::function<void(const std::shared_ptr<connection>&, http_response *)>
		    on_receive_callback;

	private:
		beast::flat_buffer buffer;
		on_receive_callback on_receive_cb;
		http::request<http::empty_body> request;
		std::optional<http::response_parser<http::vector_body<char>>> parser;
		tcp::resolver * const resolver = nullptr;
		size_t sequence_number = 0;
		bool connected = false;

		virtual void async_read()
		{
			auto& stream = get_tcp_stream();

			stream.expires_after(timeout);
			do_async_read(stream);
		}

		virtual void async_write()
		{
			auto& stream = get_tcp_stream();

			stream.expires_after(timeout);
			do_async_write(stream);
		}

		virtual beast::tcp_stream& get_tcp_stream() = 0;

		void fail(const beast::error_code& ec)
		{
			connected = false;
			on_error(host, ec);
		}

		void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
		{
			if (ec) {
				BOOST_LOG_TRIVIAL(error) << "Failed to connect to: " << host
							 << " Error code: " << ec.message();
				fail(ec);
			}
			else
				post_connect();
		}

		void on_read(beast::error_code ec, size_t)
		{
			if (ec)
				fail(ec);
			else
				on_receive_cb(shared_from_this(), &parser->get());
		}

		void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
		{
			if (ec) {
				BOOST_LOG_TRIVIAL(error) << "Failed to resolve: " << host
							 << " Error code: " << ec.message();
				fail(ec);
			}
			else {
				BOOST_LOG_TRIVIAL(trace) << "Establishing connection "
							 << sequence_number << " to: " << host;

				if (pre_connect()) {
					auto& stream = get_tcp_stream();

					stream.expires_after(timeout);
					stream.async_connect(
					    results,
					    beast::bind_front_handler(&connection::on_connect,
								      shared_from_this()));
				}
				else {
					BOOST_LOG_TRIVIAL(error)
					    << "Failed to connect to: " << host;
					fail(asio::error::make_error_code(
					    asio::error::connection_refused));
				}
			}
		}

		void on_write(beast::error_code ec, size_t)
		{
			if (ec)
				fail(ec);
			else {
				// Media segments easily exceed the default body limit.
				parser.emplace();
				parser->body_limit((std::numeric_limits<std::uint64_t>::max)());
				async_read();
			}
		}

		virtual bool pre_connect()
		{
			return true;
		}

	protected:
		// Always carries a port, e.g. "example.com:443" or "[::1]:80".
		std::string host;
		on_error_callback on_error;

		connection(size_t sequence_number, const std::string_view& h, tcp::resolver *resolver) :
		    resolver(resolver), sequence_number(sequence_number), host(h)
		{
			request.version(http_version);
			request.set(http::field::user_agent, user_agent);
			request.set(http::field::accept, "*/*");
			request.set(http::field::host, host);
		}

		connection(const connection&) = default;
		connection(connection&&) = default;
		virtual ~connection() = default;

		std::string_view host_name() const noexcept
		{
			std::string_view h {host};

			h = h.substr(0, h.rfind(port_delimiter));

			if (h.size() > 1 && h.front() == '[' && h.back() == ']')
				h = h.substr(1, h.size() - 2);

			return h;
		}

		template<typename stream> void do_async_read(stream& s)
		{
			http::async_read(
			    s,
			    buffer,
			    *parser,
			    beast::bind_front_handler(&connection::on_read, shared_from_this()));
		}

		template<typename stream> void do_async_write(stream& s)
		{
			http::async_write(
			    s,
			    request,
			    beast::bind_front_handler(&connection::on_write, shared_from_this()));
		}

		virtual void post_connect()
		{
			connected = true;
			async_write();
		}

	public:
		void get(const std::string_view& resource,
			 on_receive_callback&& on_receive_fn,
			 on_error_callback&& on_error_cb)
		{
			request.method(http::verb::get);
			request.target(beast::string_view {resource.data(), resource.size()});
			on_error = std::move(on_error_cb);
			on_receive_cb = std::move(on_receive_fn);

			if (connected)
				async_write();
			else {
				const std::string_view h {host};

				resolver->async_resolve(
				    host_name(),
				    h.substr(h.rfind(port_delimiter) + 1),
				    beast::bind_front_handler(&connection::on_resolve,
							      shared_from_this()));
			}
		}

		const std::string& get_host() const noexcept
		{
			return host;
		}
};

class http_connection : public virtual connection {
		beast::tcp_stream stream;

		beast::tcp_stream& get_tcp_stream() override
		{
			return stream;
		}

	public:
		http_connection(size_t sequence_number,
				const std::string_view& h,
				asio::io_context *io,
				tcp::resolver *resolver) :
		    connection(sequence_number, h, resolver),
		    stream(*io)
		{
		}
};

class https_connection : public virtual connection {
		beast::ssl_stream<beast::tcp_stream> stream;

		void async_read() override
		{
			get_tcp_stream().expires_after(timeout);
			do_async_read(stream);
		}

		void async_write() override
		{
			get_tcp_stream().expires_after(timeout);
			do_async_write(stream);
		}

		beast::tcp_stream& get_tcp_stream() override
		{
			return beast::get_lowest_layer(stream);
		}

		void on_handshake(beast::error_code ec)
		{
			if (ec) {
				BOOST_LOG_TRIVIAL(error) << "Failed TLS handshake with: " << host
							 << " Error code: " << ec.message();
				on_error(host, ec);
			}
			else
				connection::post_connect();
		}

		void post_connect() override
		{
			auto c = std::dynamic_pointer_cast<https_connection>(shared_from_this());

			get_tcp_stream().expires_after(timeout);
			stream.async_handshake(
			    asio::ssl::stream_base::client,
			    beast::bind_front_handler(&https_connection::on_handshake, c));
		}

		bool pre_connect() override
		{
			const std::string h {host_name()};

			return SSL_set_tlsext_host_name(stream.native_handle(), h.c_str()) &&
			       SSL_set1_host(stream.native_handle(), h.c_str());
		}

	public:
		https_connection(size_t sequence_number,
				 const std::string_view& h,
				 asio::io_context *io,
				 tcp::resolver *resolver,
				 ssl::context *tls_context) :
		    connection(sequence_number, h, resolver),
		    stream(*io, *tls_context)
		{
		}
};

#endif // CONNECTION_H
