#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <optional>
#include <exception>
#include <functional>
#include <algorithm>

#include <boost/asio.hpp>

#include <scs/scs-error.hxx>
#include <scs/http/http-request.hxx>
#include <scs/http/http-response.hxx>

namespace scs
{
  namespace asio = boost::asio;

  // In-process stand-in for basic_http_client. Every request is recorded
  // and answered by the handler.
  //
  // Streamed bodies are delivered in small chunks so that callers see more
  // than one callback per response.
  //
  class fake_http_client
  {
  public:
    using request_type    = http_request;
    using response_type   = http_response;
    using body_callback   = std::function<void (const char*, std::size_t)>;
    using header_callback = std::function<void (const response_type&)>;
    using read_function   = std::function<std::size_t (char*, std::size_t)>;
    using handler_type    = std::function<response_type (const request_type&)>;

    static constexpr std::size_t chunk_size = 7;

    explicit
    fake_http_client (handler_type h): handler_ (std::move (h)) {}

    asio::awaitable<response_type>
    request (const request_type& r)
    {
      co_return handle (r);
    }

    asio::awaitable<response_type>
    stream (const request_type& r,
            body_callback body,
            header_callback header = nullptr)
    {
      response_type res (handle (r));

      if (res.is_success () && body)
      {
        if (header)
          header (res);

        const std::string& t (res.text ());

        for (std::size_t i (0); i < t.size (); i += chunk_size)
          body (t.data () + i, std::min (chunk_size, t.size () - i));

        res.body = std::nullopt;
      }

      co_return res;
    }

    asio::awaitable<response_type>
    upload (const request_type& r, std::uint64_t size, read_function read)
    {
      request_type c (r);
      std::string b;

      char buf[5];
      while (b.size () < size)
      {
        std::size_t n (read (buf,
                             static_cast<std::size_t> (
                               std::min<std::uint64_t> (sizeof (buf),
                                                        size - b.size ()))));
        if (n == 0)
          throw error (errc::malformed_value, "upload body ended early");

        b.append (buf, n);
      }

      c.body = std::move (b);
      co_return handle (c);
    }

    // Requests in the order they were made (uploads with their body read
    // in).
    //
    std::vector<request_type> requests;

  private:
    response_type
    handle (const request_type& r)
    {
      requests.push_back (r);
      return handler_ (r);
    }

  private:
    handler_type handler_;
  };

  // Run a coroutine to completion on a private io_context and return its
  // result, rethrowing its exception.
  //
  template <typename T>
  T
  run (asio::awaitable<T> a)
  {
    asio::io_context ioc;
    std::optional<T> r;
    std::exception_ptr e;

    asio::co_spawn (ioc,
                    std::move (a),
                    [&r, &e] (std::exception_ptr x, T v)
                    {
                      if (x)
                        e = x;
                      else
                        r = std::move (v);
                    });
    ioc.run ();

    if (e)
      std::rethrow_exception (e);

    return std::move (*r);
  }

  inline void
  run (asio::awaitable<void> a)
  {
    asio::io_context ioc;
    std::exception_ptr e;

    asio::co_spawn (ioc,
                    std::move (a),
                    [&e] (std::exception_ptr x) {e = x;});
    ioc.run ();

    if (e)
      std::rethrow_exception (e);
  }

  // Response with a body and optional headers.
  //
  inline http_response
  make_response (http_status s,
                 std::string body = std::string (),
                 std::vector<std::pair<std::string, std::string>> headers = {})
  {
    http_response r (s);

    if (!body.empty ())
      r.body = std::move (body);

    for (auto& h: headers)
      r.set_header (std::move (h.first), std::move (h.second));

    return r;
  }

  // Answer a GET for data the way a range-capable server does: 206 with
  // the requested slice if there is a Range header, 200 with everything
  // otherwise.
  //
  inline http_response
  serve_range (const std::string& data, const http_request& r)
  {
    std::optional<std::string> h (r.get_header ("Range"));

    if (!h)
      return make_response (http_status::ok,
                            data,
                            {{"Content-Length", std::to_string (data.size ())}});

    // bytes=<first>-<last>
    //
    std::size_t d (h->find ('-'));
    std::uint64_t f (std::stoull (h->substr (6, d - 6)));
    std::uint64_t l (std::stoull (h->substr (d + 1)));

    if (f >= data.size ())
      return make_response (http_status::range_not_satisfiable);

    l = std::min<std::uint64_t> (l, data.size () - 1);

    return make_response (
      http_status::partial_content,
      data.substr (static_cast<std::size_t> (f),
                   static_cast<std::size_t> (l - f + 1)),
      {{"Content-Range",
        "bytes " + std::to_string (f) + '-' + std::to_string (l) + '/' +
        std::to_string (data.size ())}});
  }
}
