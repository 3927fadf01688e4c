#include <scs/auth/auth-credentials.hxx>

#include <cassert>

using namespace std;
using namespace scs;

static void
test_apply ()
{
  http_request r (http_method::get, "https://reg.io/v2/");

  none_credentials ().apply (r);
  assert (r.get_header ("Authorization") == "none");

  basic_credentials ("user", "pass").apply (r);
  assert (r.get_header ("Authorization") == "Basic dXNlcjpwYXNz");

  bearer_credentials b ("abc.def");
  b.apply (r);
  assert (r.get_header ("Authorization") == "Bearer abc.def");
  assert (b.kind () == credential_kind::bearer);

  // Always replaced, never duplicated.
  //
  assert (r.headers.size () == 1);
}

static void
test_base64 ()
{
  assert (base64_encode ("") == "");
  assert (base64_encode ("f") == "Zg==");
  assert (base64_encode ("fo") == "Zm8=");
  assert (base64_encode ("foo") == "Zm9v");
  assert (base64_encode ("foobar") == "Zm9vYmFy");
}

// Scoped upload credentials come from the Authorization header that was
// actually sent.
//
static void
test_from_authorization ()
{
  {
    credentials_ptr c (bearer_from_authorization ("Bearer tok"));
    assert (c != nullptr);
    assert (c->kind () == credential_kind::bearer);
    assert (static_cast<const bearer_credentials&> (*c).token () == "tok");
  }

  assert (bearer_from_authorization ("bearer tok") != nullptr);
  assert (bearer_from_authorization ("Basic dXNlcjpwYXNz") == nullptr);
  assert (bearer_from_authorization ("none") == nullptr);
  assert (bearer_from_authorization ("Bearer ") == nullptr);
  assert (bearer_from_authorization ("") == nullptr);
}

static void
test_access ()
{
  namespace_access a {"library/default", {access_type::pull}};
  assert (a.types_string () == "pull");
  assert (a.scope () == "repository:library/default:pull");

  a.types.push_back (access_type::push);
  assert (a.types_string () == "pull,push");
  assert (a.scope () == "repository:library/default:pull,push");
}

int
main ()
{
  test_apply ();
  test_base64 ();
  test_from_authorization ();
  test_access ();
}
