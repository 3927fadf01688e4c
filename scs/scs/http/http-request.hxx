#pragma once

#include <string>
#include <utility>
#include <optional>

#include <scs/http/http-types.hxx>

namespace scs
{
  // HTTP request.
  //
  // The URL is always absolute. The body, if present, is held in memory;
  // streamed request bodies go through basic_http_client::upload() instead.
  //
  template <typename S, typename B = S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_method              method = http_method::get;
    string_type              url;
    http_version             version;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_request () = default;

    basic_http_request (http_method m, string_type u)
      : method (m), url (std::move (u)) {}

    // Path, query and fragment of the URL.
    //
    string_type
    target () const;

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    void
    set_content_type (string_type ct)
    {
      set_header (string_type ("Content-Type"), std::move (ct));
    }

    void
    set_authorization (string_type auth)
    {
      set_header (string_type ("Authorization"), std::move (auth));
    }

    void
    set_bearer_token (const string_type& token)
    {
      set_authorization (string_type ("Bearer ") + token);
    }

    // Request the inclusive byte range [first, last].
    //
    void
    set_range (std::uint64_t first, std::uint64_t last)
    {
      set_header (string_type ("Range"),
                  "bytes=" + std::to_string (first) + '-' +
                  std::to_string (last));
    }

    void
    set_body (body_type b)
    {
      body = std::move (b);
    }
  };

  using http_request = basic_http_request<std::string>;
}

#include <scs/http/http-request.ixx>
