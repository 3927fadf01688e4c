#include <scs/http/http-url.hxx>

#include <cctype>
#include <stdexcept>

using namespace std;

namespace scs
{
  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    if (size_t p = url.find ("://"); p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;

      for (char& c: r.scheme)
        c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }
    else
      r.scheme = "http";

    // The authority ends at the path, the query, or the fragment, whichever
    // comes first.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));

    // Drop user info, we never use it for authentication.
    //
    if (size_t at = auth.rfind ('@'); at != string::npos)
      auth.erase (0, at + 1);

    size_t colon (auth.rfind (':'));

    // Bracketed IPv6 literal: the port colon, if any, follows ']'.
    //
    if (!auth.empty () && auth[0] == '[')
    {
      size_t rb (auth.find (']'));
      if (rb == string::npos)
        throw invalid_argument ("invalid URL host: " + url);

      if (colon != string::npos && colon < rb)
        colon = string::npos;
    }

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
      r.host = auth;

    if (r.port.empty ())
      r.port = r.scheme == "https" ? "443" : "80";

    if (r.host.empty ())
      throw invalid_argument ("invalid URL '" + url + "': no host");

    for (char& c: r.host)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    if (end < url.size ())
    {
      r.target = url.substr (end);

      if (r.target[0] != '/')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  bool
  same_origin (const string& x, const string& y)
  {
    url_parts a (parse_url (x));
    url_parts b (parse_url (y));

    return a.scheme == b.scheme && a.host == b.host && a.port == b.port;
  }

  string
  resolve_reference (const string& base, const string& ref)
  {
    if (ref.find ("://") != string::npos)
      return ref;

    url_parts b (parse_url (base));

    if (ref.compare (0, 2, "//") == 0)
      return b.scheme + ':' + ref;

    if (!ref.empty () && ref[0] == '/')
      return b.scheme + "://" + b.authority () + ref;

    // Relative path: replace everything after the last slash of the base
    // path (ignoring its query).
    //
    string path (b.target.substr (0, b.target.find_first_of ("?#")));
    path.erase (path.rfind ('/') + 1);

    if (ref.empty ())
      return b.string ();

    if (ref[0] == '?')
      return b.scheme + "://" + b.authority () +
        b.target.substr (0, b.target.find_first_of ("?#")) + ref;

    return b.scheme + "://" + b.authority () + path + ref;
  }

  string
  url_encode (const string& s)
  {
    static const char hex[] = "0123456789ABCDEF";

    string r;
    r.reserve (s.size ());

    for (unsigned char c: s)
    {
      if (isalnum (c) || c == '-' || c == '_' || c == '.' || c == '~')
        r += static_cast<char> (c);
      else
      {
        r += '%';
        r += hex[c >> 4];
        r += hex[c & 0x0f];
      }
    }

    return r;
  }

  string
  append_query (string url, const vector<pair<string, string>>& q)
  {
    bool first (url.find ('?') == string::npos);

    for (const auto& [n, v]: q)
    {
      url += first ? '?' : '&';
      url += url_encode (n);
      url += '=';
      url += url_encode (v);
      first = false;
    }

    return url;
  }

  string
  join_url (const string& base, const string& path)
  {
    if (base.empty ())
      return path;

    bool bs (base.back () == '/');
    bool ps (!path.empty () && path.front () == '/');

    if (bs && ps)
      return base + path.substr (1);

    if (!bs && !ps)
      return base + '/' + path;

    return base + path;
  }
}
