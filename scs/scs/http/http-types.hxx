#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <optional>

namespace scs
{
  // HTTP method.
  //
  enum class http_method
  {
    get,
    head,
    post,
    put,
    patch,
    delete_
  };

  std::string
  to_string (http_method);

  // HTTP status code.
  //
  // Only the codes the library client and the registry make decisions on are
  // named. Any other code received on the wire is still representable since
  // the underlying type is the numeric status.
  //
  enum class http_status: std::uint16_t
  {
    ok                    = 200,
    created               = 201,
    accepted              = 202,
    no_content            = 204,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    range_not_satisfiable = 416,

    internal_server_error = 500,
    service_unavailable   = 503
  };

  std::string
  to_string (http_status);

  // Case-insensitive comparison of header names (RFC 7230).
  //
  bool
  header_name_equal (const std::string&, const std::string&) noexcept;

  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
      : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y)
  {
    return x.name == y.name && x.value == y.value;
  }

  // Ordered header list. Lookups are case-insensitive and return the first
  // matching field.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Replace any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Append, allowing duplicates.
    //
    void
    add (string_type name, string_type value);

    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using iterator       = typename fields_type::iterator;
    using const_iterator = typename fields_type::const_iterator;

    iterator       begin ()       noexcept {return fields.begin ();}
    const_iterator begin () const noexcept {return fields.begin ();}
    iterator       end ()         noexcept {return fields.end ();}
    const_iterator end ()   const noexcept {return fields.end ();}
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
      : major (maj), minor (min) {}
  };
}

#include <scs/http/http-types.ixx>
