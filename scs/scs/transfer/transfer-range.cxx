#include <scs/transfer/transfer-range.hxx>

#include <charconv>

#include <scs/scs-error.hxx>
#include <scs/http/http-types.hxx>

using namespace std;

namespace scs
{
  static bool
  parse_uint (const string& s, size_t b, size_t e, uint64_t& r)
  {
    if (b >= e)
      return false;

    auto x (from_chars (s.data () + b, s.data () + e, r));
    return x.ec == std::errc () && x.ptr == s.data () + e;
  }

  uint64_t
  parse_content_range (const string& v)
  {
    auto fail = [&v] ()
    {
      return error (errc::malformed_value,
                    "unexpected/malformed value: Content-Range '" + v + "'");
    };

    // The unit is case-insensitive (RFC 7233).
    //
    size_t sp (v.find (' '));

    if (sp == string::npos || !header_name_equal (v.substr (0, sp), "bytes"))
      throw fail ();

    size_t b (sp + 1);
    size_t dash (v.find ('-', b));
    size_t slash (v.find ('/', b));

    if (dash == string::npos || slash == string::npos || dash > slash)
      throw fail ();

    uint64_t first, last, length;
    if (!parse_uint (v, b, dash, first) ||
        !parse_uint (v, dash + 1, slash, last) ||
        !parse_uint (v, slash + 1, v.size (), length))
      throw fail ();

    if (first > last || last >= length)
      throw fail ();

    return length;
  }

  string
  content_range (uint64_t f, uint64_t l, uint64_t n)
  {
    return "bytes " + std::to_string (f) + '-' + std::to_string (l) + '/' +
      std::to_string (n);
  }
}
