#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

#include <scs/scs-error.hxx>
#include <scs/transfer/transfer-file.hxx>
#include <scs/transfer/transfer-types.hxx>

namespace scs
{
  // Body callback that writes a part's bytes into the sink at the part's
  // absolute offsets, advancing its cursor.
  //
  // Throws scs::error with malformed_value if more bytes arrive than the
  // part has room for, which is what a server ignoring the Range header
  // looks like.
  //
  class part_writer
  {
  public:
    part_writer (positional_sink& s, part_descriptor& p)
      : sink_ (&s), part_ (&p) {}

    void
    operator() (const char* data, std::size_t size);

  private:
    positional_sink* sink_;
    part_descriptor* part_;
  };

  // Check the response to a ranged request for a part once the body has
  // been written. Anything but 206 is only acceptable for a part starting
  // at offset 0 (a server may answer a full-range request with 200), and the
  // part must have been filled completely.
  //
  template <typename R>
  void
  verify_part_response (const R& r, const part_descriptor& p)
  {
    std::uint16_t s (r.status_code ());

    if (s != 206 && !(s == 200 && p.start == 0))
    {
      if (r.is_success ())
        throw http_status_error (errc::http_status,
                                 s,
                                 "unexpected http status " +
                                 std::to_string (s) + " for ranged request");

      throw http_status_error (s, r.text ());
    }

    if (!p.complete ())
      throw error (errc::malformed_value,
                   "short read: got " + std::to_string (p.cursor) +
                   " of " + std::to_string (p.size ()) +
                   " bytes for range " + std::to_string (p.start) + '-' +
                   std::to_string (p.end));
  }
}
