#pragma once

#include <string>
#include <vector>
#include <utility>

namespace scs
{
  // Components of an absolute http(s) URL.
  //
  // The port is always filled in, defaulted from the scheme when the URL
  // does not name one. The target holds path, query and fragment and is at
  // least "/".
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool
    default_port () const
    {
      return (scheme == "https" && port == "443") ||
             (scheme == "http" && port == "80");
    }

    // host[:port] suitable for the Host header.
    //
    std::string
    authority () const
    {
      return default_port () ? host : host + ':' + port;
    }

    std::string
    string () const
    {
      return scheme + "://" + authority () + target;
    }
  };

  // Parse scheme://host[:port][/target]. A missing scheme is taken to be
  // http. Throws std::invalid_argument if there is no host.
  //
  url_parts
  parse_url (const std::string&);

  // Return true if both URLs share scheme, host and port. Credentials are
  // only forwarded across a redirect when this holds.
  //
  bool
  same_origin (const std::string&, const std::string&);

  // Resolve a Location-style reference against the URL it was returned
  // for. Handles absolute URLs, scheme-relative (//host/...), absolute
  // paths and relative paths.
  //
  std::string
  resolve_reference (const std::string& base, const std::string& ref);

  // Percent-encode a query component (RFC 3986 unreserved set kept).
  //
  std::string
  url_encode (const std::string&);

  // Append name=value pairs to the URL's query, using '?' or '&' as
  // appropriate.
  //
  std::string
  append_query (std::string url,
                const std::vector<std::pair<std::string, std::string>>&);

  // Join a base URL and a path without doubling or dropping the slash.
  //
  std::string
  join_url (const std::string& base, const std::string& path);
}
