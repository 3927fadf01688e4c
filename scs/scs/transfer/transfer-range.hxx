#pragma once

#include <string>
#include <cstdint>

namespace scs
{
  // Extract the complete length from a Content-Range value of the form
  // "bytes <first>-<last>/<length>".
  //
  // Throws scs::error with malformed_value for anything else, including an
  // unknown ("*") length.
  //
  std::uint64_t
  parse_content_range (const std::string&);

  // "bytes <first>-<last>/<length>"
  //
  std::string
  content_range (std::uint64_t first, std::uint64_t last, std::uint64_t length);
}
