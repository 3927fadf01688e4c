#include <scs/http/http-url.hxx>

#include <cassert>
#include <stdexcept>

using namespace std;
using namespace scs;

static void
test_parse ()
{
  {
    url_parts u (parse_url ("https://Library.Sylabs.IO/v1/imagefile/a/b/c:latest"));

    assert (u.scheme == "https");
    assert (u.host == "library.sylabs.io");
    assert (u.port == "443");
    assert (u.target == "/v1/imagefile/a/b/c:latest");
    assert (u.default_port ());
    assert (u.authority () == "library.sylabs.io");
  }

  // Explicit port, no path.
  //
  {
    url_parts u (parse_url ("http://localhost:5000"));

    assert (u.host == "localhost");
    assert (u.port == "5000");
    assert (u.target == "/");
    assert (u.authority () == "localhost:5000");
    assert (u.string () == "http://localhost:5000/");
  }

  // Query directly after the authority, user info, IPv6.
  //
  {
    url_parts u (parse_url ("https://user:pw@example.com?x=1"));
    assert (u.host == "example.com");
    assert (u.target == "/?x=1");

    url_parts v (parse_url ("http://[::1]:8080/p"));
    assert (v.host == "[::1]");
    assert (v.port == "8080");

    url_parts w (parse_url ("http://[::1]/p"));
    assert (w.host == "[::1]");
    assert (w.port == "80");
  }

  // No host.
  //
  {
    bool thrown (false);
    try
    {
      parse_url ("https:///path");
    }
    catch (const invalid_argument&)
    {
      thrown = true;
    }
    assert (thrown);
  }
}

// Credentials only survive a redirect to the same scheme, host and port.
//
static void
test_origin ()
{
  assert (same_origin ("https://a.io/x", "https://A.io:443/y"));
  assert (!same_origin ("https://a.io/x", "http://a.io/x"));
  assert (!same_origin ("https://a.io/x", "https://b.a.io/x"));
  assert (!same_origin ("http://a.io:80/x", "http://a.io:8080/x"));
}

static void
test_resolve ()
{
  const string b ("https://reg.io/v2/a/b/blobs/uploads/123?state=x");

  assert (resolve_reference (b, "https://s3.io/bucket/o") ==
          "https://s3.io/bucket/o");
  assert (resolve_reference (b, "//cdn.io/o") == "https://cdn.io/o");
  assert (resolve_reference (b, "/v2/a/b/blobs/uploads/456?state=y") ==
          "https://reg.io/v2/a/b/blobs/uploads/456?state=y");
  assert (resolve_reference (b, "456") ==
          "https://reg.io/v2/a/b/blobs/uploads/456");
  assert (resolve_reference (b, "?state=z") ==
          "https://reg.io/v2/a/b/blobs/uploads/123?state=z");
}

static void
test_query ()
{
  assert (url_encode ("a/b c:pull,push") == "a%2Fb%20c%3Apull%2Cpush");
  assert (url_encode ("sha256:ab") == "sha256%3Aab");

  assert (append_query ("https://x.io/v1/oci-redirect",
                        {{"namespace", "e/c"}, {"accessTypes", "pull"}}) ==
          "https://x.io/v1/oci-redirect?namespace=e%2Fc&accessTypes=pull");

  assert (append_query ("https://x.io/u?state=1", {{"digest", "sha256:0"}}) ==
          "https://x.io/u?state=1&digest=sha256%3A0");

  assert (join_url ("https://x.io", "v2/") == "https://x.io/v2/");
  assert (join_url ("https://x.io/", "/v2/") == "https://x.io/v2/");
  assert (join_url ("https://x.io/", "v2/") == "https://x.io/v2/");
}

int
main ()
{
  test_parse ();
  test_origin ();
  test_resolve ();
  test_query ();
}
