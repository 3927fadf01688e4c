#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <optional>

#include <scs/http/http-types.hxx>

namespace scs
{
  // HTTP response.
  //
  // For streamed responses the body is left empty when it was handed to the
  // caller's callback; non-success bodies are always buffered so they can be
  // quoted in errors.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_status              status;
    string_type              reason;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_response (): status (http_status::ok) {}

    explicit
    basic_http_response (http_status s): status (s) {}

    basic_http_response (http_status s, body_type b)
      : status (s), body (std::move (b)) {}

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

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

    std::optional<string_type>
    content_type () const
    {
      return get_header (string_type ("Content-Type"));
    }

    std::optional<std::uint64_t>
    content_length () const;

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    // Body or empty string.
    //
    const body_type&
    text () const
    {
      static const body_type e;
      return body ? *body : e;
    }
  };

  using http_response = basic_http_response<std::string>;
}

#include <scs/http/http-response.ixx>
