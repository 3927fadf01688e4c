#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <scs/http/http-url.hxx>
#include <scs/http/http-types.hxx>
#include <scs/http/http-request.hxx>
#include <scs/http/http-response.hxx>

namespace scs
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client configuration traits.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds (0 = no timeout).
    //
    std::uint32_t connect_timeout = 30000;

    // Timeout for each read or write on an established connection, in
    // milliseconds (0 = no timeout). It is re-armed for every chunk so a
    // large transfer that keeps making progress never hits it.
    //
    std::uint32_t request_timeout = 60000;

    std::uint8_t max_redirects = 10;

    bool verify_ssl = true;

    // CA bundle (empty = system default verify paths).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("scs-library-client/1.0");

    // Follow 3xx responses in request(). Never applies to stream() and
    // upload().
    //
    bool follow_redirects = true;
  };

  // Per-client connection context: the io_context and the TLS context
  // shared by all connections.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // Asynchronous HTTP/1.1 client over Boost.Beast.
  //
  // Every call opens its own connection, so any number of calls may be in
  // flight at once from different coroutines.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    // Receives successive chunks of a successful response body.
    //
    using body_callback = std::function<void (const char*, std::size_t)>;

    // Called with the status and headers of a successful response before
    // any of its body is delivered.
    //
    using header_callback = std::function<void (const response_type&)>;

    // Fills the buffer with up to n bytes of the request body and returns
    // the count. Returning 0 before the declared size is reached is an
    // error.
    //
    using read_function = std::function<std::size_t (char*, std::size_t)>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform a request and buffer the whole response.
    //
    asio::awaitable<response_type>
    request (const request_type& req);

    // Perform a request and hand a successful response body to the
    // callback as it arrives. A non-success body is buffered in the
    // returned response instead.
    //
    asio::awaitable<response_type>
    stream (const request_type& req,
            body_callback body,
            header_callback header = nullptr);

    // Perform a request whose body of exactly size bytes is pulled from the
    // reader. The response is buffered.
    //
    asio::awaitable<response_type>
    upload (const request_type& req, std::uint64_t size, read_function read);

    const traits_type&
    traits () const noexcept
    {
      return session_->traits ();
    }

  private:
    asio::awaitable<response_type>
    request_impl (request_type req, std::uint8_t redirect_count);

    // Send the request over a fresh connection and read the response.
    //
    asio::awaitable<response_type>
    perform (const request_type& req,
             const read_function* source,
             std::uint64_t source_size,
             const body_callback* sink,
             const header_callback* header = nullptr);

    // Resolve and connect to the URL's host, over TLS for https, and run f
    // on the resulting stream.
    //
    template <typename F>
    asio::awaitable<response_type>
    connect (const url_parts& url, F f);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <scs/http/http-client.ixx>
#include <scs/http/http-client.txx>
