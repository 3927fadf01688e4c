#pragma once

#include <map>
#include <string>
#include <vector>
#include <ostream>

namespace scs
{
  enum class auth_scheme
  {
    unknown,
    basic,
    bearer
  };

  std::string
  to_string (auth_scheme);

  inline std::ostream&
  operator<< (std::ostream& o, auth_scheme s)
  {
    return o << to_string (s);
  }

  // Parsed WWW-Authenticate value. Only the parameters used for token
  // negotiation are kept.
  //
  struct auth_challenge
  {
    auth_scheme scheme = auth_scheme::unknown;
    std::string realm;
    std::string service;
    std::string scope;
  };

  // Split a comma-separated list (RFC 2068, 2.1) into trimmed elements.
  // Commas inside quoted strings do not separate and a backslash inside a
  // quoted string escapes the next character (the backslash is dropped).
  //
  std::vector<std::string>
  parse_list (const std::string&);

  // Parse a list of key=value / key="value" elements. Quoted values are
  // unquoted; an element without '=' maps to the empty string.
  //
  std::map<std::string, std::string>
  parse_pairs (const std::string&);

  // Parse "<scheme> <parameters>". Throws scs::error with
  // invalid_auth_header if there is no space-separated parameter part and
  // with unknown_auth_type if the scheme is neither Basic nor Bearer
  // (case-insensitively).
  //
  auth_challenge
  parse_auth_challenge (const std::string&);
}
