#include <scs/transfer/transfer-range.hxx>

#include <cassert>

#include <scs/scs-error.hxx>

using namespace std;
using namespace scs;

static bool
malformed (const string& v)
{
  try
  {
    parse_content_range (v);
  }
  catch (const error& e)
  {
    assert (e.code () == scs::errc::malformed_value);
    return true;
  }

  return false;
}

static void
test_parse ()
{
  assert (parse_content_range ("bytes 0-1000/2000") == 2000);
  assert (parse_content_range ("bytes 0-0/1") == 1);
  assert (parse_content_range ("Bytes 0-9/10") == 10);
  assert (parse_content_range ("BYTES 0-9/10") == 10);
  assert (parse_content_range ("bytes 5242880-10485759/31457280") ==
          31457280);

  assert (parse_content_range (content_range (3, 5, 30)) == 30);
  assert (content_range (3, 5, 30) == "bytes 3-5/30");
}

static void
test_malformed ()
{
  assert (malformed (""));
  assert (malformed ("bytes"));
  assert (malformed ("items 0-1/2"));
  assert (malformed ("bytesx 0-1/2"));
  assert (malformed ("bytes 0-1"));
  assert (malformed ("bytes 0-1/*"));
  assert (malformed ("bytes */2000"));
  assert (malformed ("bytes 5-1/10"));
  assert (malformed ("bytes 0-10/10"));
  assert (malformed ("bytes 0-1/20x"));
}

int
main ()
{
  test_parse ();
  test_malformed ();
}
