#include <limits>
#include <chrono>
#include <algorithm>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <scs/scs-error.hxx>

namespace scs
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
    case http_method::get:     return http::verb::get;
    case http_method::head:    return http::verb::head;
    case http_method::post:    return http::verb::post;
    case http_method::put:     return http::verb::put;
    case http_method::patch:   return http::verb::patch;
    case http_method::delete_: return http::verb::delete_;
    }
    return http::verb::get;
  }

  // Arm the stream timer, 0 meaning no timeout.
  //
  inline void
  expire_after (beast::tcp_stream& s, std::uint32_t ms)
  {
    if (ms != 0)
      s.expires_after (std::chrono::milliseconds (ms));
    else
      s.expires_never ();
  }

  // Copy the request line fields and headers shared by both body kinds.
  //
  template <typename M, typename R>
  inline void
  to_beast_header (M& m,
                   const R& req,
                   const url_parts& u,
                   const std::string& user_agent)
  {
    m.method (to_beast_verb (req.method));
    m.target (u.target);
    m.version (req.version.major * 10 + req.version.minor);

    for (const auto& h: req.headers)
      m.set (h.name, h.value);

    // The Host header follows the URL, so it stays correct when a request is
    // re-targeted at another host.
    //
    m.set (http::field::host, u.authority ());

    if (m.find (http::field::user_agent) == m.end () && !user_agent.empty ())
      m.set (http::field::user_agent, user_agent);
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req, std::uint8_t redirect_count)
  {
    const auto& tr (session_->traits ());

    response_type r (co_await perform (req, nullptr, 0, nullptr));

    if (!tr.follow_redirects || !r.is_redirection ())
      co_return r;

    auto loc (r.location ());
    if (!loc)
      co_return r;

    if (redirect_count >= tr.max_redirects)
      throw error (errc::too_many_redirects,
                   "stopped after " + std::to_string (tr.max_redirects) +
                   " redirects");

    request_type next (req.method, resolve_reference (req.url, *loc));
    next.headers = req.headers;
    next.body = req.body;

    // Never leak credentials to another origin.
    //
    if (!same_origin (req.url, next.url))
      next.headers.remove ("Authorization");

    // 303 turns everything but HEAD into a bodyless GET (RFC 7231, 6.4.4).
    //
    if (r.status == http_status::see_other && req.method != http_method::head)
    {
      next.method = http_method::get;
      next.body = std::nullopt;
      next.headers.remove ("Content-Type");
      next.headers.remove ("Content-Length");
    }

    co_return co_await request_impl (std::move (next), redirect_count + 1);
  }

  template <typename T>
  template <typename F>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  connect (const url_parts& u, F f)
  {
    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (u.host,
                                             u.port,
                                             asio::use_awaitable));

    if (u.scheme == "https")
    {
      beast::ssl_stream<beast::tcp_stream> s (ctx, session_->ssl_context ());

      // Beast does not wrap SNI so drop down to OpenSSL for it.
      //
      if (!SSL_set_tlsext_host_name (s.native_handle (), u.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw beast::system_error (ec, "unable to set SNI hostname");
      }

      if (tr.verify_ssl)
        s.set_verify_callback (ssl::host_name_verification (u.host));

      auto& l (beast::get_lowest_layer (s));

      expire_after (l, tr.connect_timeout);
      co_await l.async_connect (addrs, asio::use_awaitable);
      co_await s.async_handshake (ssl::stream_base::client,
                                  asio::use_awaitable);

      response_type r (co_await f (s));

      // Many servers drop the connection without close_notify and waiting
      // for it can block until the timeout, so just close the socket.
      //
      beast::error_code ec;
      l.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }
    else if (u.scheme == "http")
    {
      beast::tcp_stream s (ctx);

      expire_after (s, tr.connect_timeout);
      co_await s.async_connect (addrs, asio::use_awaitable);

      response_type r (co_await f (s));

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }
    else
      throw std::invalid_argument ("unsupported URL scheme '" + u.scheme + "'");
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  perform (const request_type& req,
           const read_function* src,
           std::uint64_t src_size,
           const body_callback* sink,
           const header_callback* header)
  {
    const auto& tr (session_->traits ());
    url_parts u (parse_url (req.url));

    auto exchange = [&] (auto& s) -> asio::awaitable<response_type>
    {
      auto& l (beast::get_lowest_layer (s));

      // Send.
      //
      if (src == nullptr)
      {
        http::request<http::string_body> br;
        to_beast_header (br, req, u, tr.user_agent);

        if (req.body)
        {
          br.body () = *req.body;
          br.prepare_payload ();
        }

        expire_after (l, tr.request_timeout);
        co_await http::async_write (s, br, asio::use_awaitable);
      }
      else
      {
        http::request<http::buffer_body> br;
        to_beast_header (br, req, u, tr.user_agent);
        br.content_length (src_size);
        br.body ().data = nullptr;
        br.body ().more = true;

        http::request_serializer<http::buffer_body> sr (br);

        expire_after (l, tr.request_timeout);
        co_await http::async_write_header (s, sr, asio::use_awaitable);

        char buf[8192];
        std::uint64_t left (src_size);

        do
        {
          std::size_t n (0);

          if (left != 0)
          {
            n = (*src) (buf,
                        static_cast<std::size_t> (
                          std::min<std::uint64_t> (sizeof (buf), left)));

            if (n == 0)
              throw error (errc::malformed_value,
                           "request body ended " + std::to_string (left) +
                           " bytes short of its declared size");
            left -= n;
          }

          br.body ().data = n != 0 ? buf : nullptr;
          br.body ().size = n;
          br.body ().more = left != 0;

          beast::error_code ec;
          expire_after (l, tr.request_timeout);
          co_await http::async_write (s,
                                      sr,
                                      asio::redirect_error (asio::use_awaitable,
                                                            ec));

          if (ec == http::error::need_buffer)
            ec = {};

          if (ec)
            throw beast::system_error (ec);
        }
        while (!sr.is_done ());
      }

      // Receive.
      //
      beast::flat_buffer b;
      http::response_parser<http::buffer_body> p;
      p.body_limit (std::numeric_limits<std::uint64_t>::max ());

      // A HEAD response carries Content-Length but no body.
      //
      if (req.method == http_method::head)
        p.skip (true);

      expire_after (l, tr.request_timeout);
      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      const auto& h (p.get ());

      response_type r (static_cast<http_status> (h.result_int ()));
      r.reason = string_type (h.reason ());

      for (const auto& f: h)
        r.headers.add (string_type (f.name_string ()), string_type (f.value ()));

      bool direct (sink != nullptr && r.is_success ());

      if (direct && header != nullptr)
        (*header) (r);

      string_type body;

      char buf[8192];
      while (!p.is_done ())
      {
        p.get ().body ().data = buf;
        p.get ().body ().size = sizeof (buf);

        beast::error_code ec;
        expire_after (l, tr.request_timeout);
        co_await http::async_read (s,
                                   b,
                                   p,
                                   asio::redirect_error (asio::use_awaitable,
                                                         ec));

        if (ec == http::error::need_buffer)
          ec = {};

        if (ec)
          throw beast::system_error (ec);

        std::size_t n (sizeof (buf) - p.get ().body ().size);

        if (n == 0)
          continue;

        if (direct)
          (*sink) (buf, n);
        else
          body.append (buf, n);
      }

      if (!body.empty ())
        r.body = std::move (body);

      co_return r;
    };

    co_return co_await connect (u, exchange);
  }
}
