#include <scs/auth/auth-credentials.hxx>

#include <openssl/evp.h>

#include <scs/http/http-types.hxx>

using namespace std;

namespace scs
{
  void none_credentials::
  apply (http_request& r) const
  {
    r.set_authorization ("none");
  }

  void basic_credentials::
  apply (http_request& r) const
  {
    r.set_authorization ("Basic " + base64_encode (user_ + ':' + password_));
  }

  void bearer_credentials::
  apply (http_request& r) const
  {
    r.set_bearer_token (token_);
  }

  credentials_ptr
  bearer_from_authorization (const string& v)
  {
    size_t sp (v.find (' '));

    if (sp == string::npos || !header_name_equal (v.substr (0, sp), "bearer"))
      return nullptr;

    string t (v.substr (sp + 1));

    if (t.empty ())
      return nullptr;

    return make_shared<bearer_credentials> (move (t));
  }

  string
  base64_encode (const string& s)
  {
    if (s.empty ())
      return string ();

    // EVP_EncodeBlock() writes 4 bytes per 3-byte group plus a terminating
    // NUL.
    //
    string r (4 * ((s.size () + 2) / 3) + 1, '\0');

    int n (EVP_EncodeBlock (reinterpret_cast<unsigned char*> (&r[0]),
                            reinterpret_cast<const unsigned char*> (s.data ()),
                            static_cast<int> (s.size ())));
    r.resize (static_cast<size_t> (n));
    return r;
  }

  string
  to_string (access_type t)
  {
    switch (t)
    {
    case access_type::pull: return "pull";
    case access_type::push: return "push";
    }

    return "pull";
  }

  string namespace_access::
  types_string () const
  {
    string r;

    for (access_type t: types)
    {
      if (!r.empty ())
        r += ',';

      r += to_string (t);
    }

    return r;
  }
}
