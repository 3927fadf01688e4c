#include <scs/library/library-types.hxx>

#include <scs/scs-error.hxx>

using namespace std;

namespace scs
{
  library_path
  parse_library_path (const string& s)
  {
    string p (s);

    if (p.compare (0, 10, "library://") == 0)
      p.erase (0, 10);
    else if (p.compare (0, 8, "library:") == 0)
      p.erase (0, 8);

    if (!p.empty () && p.front () == '/')
      p.erase (0, 1);

    vector<string> e;
    for (size_t b (0);;)
    {
      size_t i (p.find ('/', b));
      e.push_back (p.substr (b, i == string::npos ? string::npos : i - b));

      if (i == string::npos)
        break;

      b = i + 1;
    }

    if (e.size () != 3 || e[0].empty () || e[1].empty () || e[2].empty ())
      throw error (errc::malformed_value,
                   "not a valid library path: '" + s +
                   "' (expected entity/collection/container)");

    return library_path {move (e[0]), move (e[1]), move (e[2])};
  }

  pair<string, vector<string>>
  split_tags (const string& s)
  {
    size_t i (s.rfind (':'));

    // A colon inside the path (library://host:port/...) is not a tag
    // separator.
    //
    if (i == string::npos || s.find ('/', i) != string::npos)
      return {s, {"latest"}};

    vector<string> ts;
    for (size_t b (i + 1);;)
    {
      size_t j (s.find (',', b));
      string t (s.substr (b, j == string::npos ? string::npos : j - b));

      if (t.empty ())
        throw error (errc::malformed_value, "empty tag in '" + s + "'");

      ts.push_back (move (t));

      if (j == string::npos)
        break;

      b = j + 1;
    }

    return {s.substr (0, i), move (ts)};
  }

  string
  oci_namespace (const string& n)
  {
    size_t i (n.find ('/'));

    if (i == string::npos)
      return n;

    size_t j (n.find ('/', i + 1));
    return j == string::npos ? n : n.substr (0, j);
  }

  string
  image_hash (const digest& d)
  {
    return d.algorithm () + '.' + d.hex ();
  }
}
