#include <scs/auth/auth-challenge.hxx>

#include <scs/scs-error.hxx>
#include <scs/http/http-types.hxx>

using namespace std;

namespace scs
{
  string
  to_string (auth_scheme s)
  {
    switch (s)
    {
    case auth_scheme::basic:   return "Basic";
    case auth_scheme::bearer:  return "Bearer";
    case auth_scheme::unknown: break;
    }

    return "unknown";
  }

  static string
  trim (const string& s)
  {
    const char* ws (" \t\r\n");

    size_t b (s.find_first_not_of (ws));
    if (b == string::npos)
      return string ();

    return s.substr (b, s.find_last_not_of (ws) - b + 1);
  }

  vector<string>
  parse_list (const string& v)
  {
    vector<string> r;
    string b;
    bool escape (false), quote (false);

    for (char c: v)
    {
      if (escape)
      {
        b += c;
        escape = false;
      }
      else if (quote)
      {
        if (c == '\\')
          escape = true;
        else
        {
          if (c == '"')
            quote = false;

          b += c;
        }
      }
      else if (c == ',')
      {
        r.push_back (trim (b));
        b.clear ();
      }
      else
      {
        if (c == '"')
          quote = true;

        b += c;
      }
    }

    if (!b.empty ())
      r.push_back (trim (b));

    return r;
  }

  map<string, string>
  parse_pairs (const string& v)
  {
    map<string, string> r;

    for (const string& e: parse_list (trim (v)))
    {
      size_t i (e.find ('='));

      if (i == string::npos)
      {
        r[e] = string ();
        continue;
      }

      string x (e.substr (i + 1));

      if (x.size () >= 2 && x.front () == '"' && x.back () == '"')
        x = x.substr (1, x.size () - 2);

      r[e.substr (0, i)] = move (x);
    }

    return r;
  }

  auth_challenge
  parse_auth_challenge (const string& v)
  {
    size_t sp (v.find (' '));

    if (sp == string::npos)
      throw error (errc::invalid_auth_header, "invalid auth header: " + v);

    string s (v.substr (0, sp));

    auth_challenge r;

    if (header_name_equal (s, "basic"))
      r.scheme = auth_scheme::basic;
    else if (header_name_equal (s, "bearer"))
      r.scheme = auth_scheme::bearer;
    else
      throw error (errc::unknown_auth_type,
                   s.empty ()
                   ? string ("unknown auth type")
                   : "unknown auth type '" + s + "'");

    map<string, string> ps (parse_pairs (v.substr (sp + 1)));

    if (auto i = ps.find ("realm"); i != ps.end ())
      r.realm = i->second;

    if (auto i = ps.find ("service"); i != ps.end ())
      r.service = i->second;

    if (auto i = ps.find ("scope"); i != ps.end ())
      r.scope = i->second;

    return r;
  }
}
