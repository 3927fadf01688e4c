#include <scs/sif/sif-header.hxx>

#include <cassert>
#include <cstring>

#include <scs/scs-error.hxx>

using namespace std;
using namespace scs;

static void
put_le (string& b, size_t o, uint64_t v, size_t n)
{
  for (size_t i (0); i != n; ++i)
    b[o + i] = static_cast<char> ((v >> (8 * i)) & 0xff);
}

static void
put_str (string& b, size_t o, const char* s)
{
  memcpy (&b[o], s, strlen (s));
}

struct test_descriptor
{
  int32_t datatype;
  int32_t fstype = 0;
  int32_t parttype = 0;
  const char* arch = "";
};

// Synthetic image: the global header immediately followed by the
// descriptor table.
//
static string
make_image (const char* arch,
            const vector<test_descriptor>& ds,
            size_t unused = 0)
{
  size_t total (ds.size () + unused);

  string b (sif::header_size + total * sif::descriptor_size, '\0');

  put_str (b, 32, "SIF_MAGIC");
  put_str (b, 42, "01");
  put_str (b, 45, arch);
  put_le (b, 80, unused, 8);
  put_le (b, 88, total, 8);
  put_le (b, 96, sif::header_size, 8);

  for (size_t i (0); i != ds.size (); ++i)
  {
    size_t d (sif::header_size + i * sif::descriptor_size);

    put_le (b, d, static_cast<uint32_t> (ds[i].datatype), 4);
    b[d + 4] = 1;
    put_le (b, d + 201, static_cast<uint32_t> (ds[i].fstype), 4);
    put_le (b, d + 205, static_cast<uint32_t> (ds[i].parttype), 4);
    put_str (b, d + 209, ds[i].arch);
  }

  return b;
}

static scs::errc
header_error (const string& b)
{
  try
  {
    parse_sif_header (b);
  }
  catch (const error& e)
  {
    return e.code ();
  }

  assert (false);
  return scs::errc::malformed_value;
}

static void
test_architecture ()
{
  assert (sif_architecture ("01") == "386");
  assert (sif_architecture ("02") == "amd64");
  assert (sif_architecture ("04") == "arm64");
  assert (sif_architecture ("12") == "riscv64");
  assert (sif_architecture ("00").empty ());
  assert (sif_architecture ("13").empty ());
  assert (sif_architecture ("2").empty ());
  assert (sif_architecture ("x2").empty ());
}

static void
test_header ()
{
  // Partition architecture overrides the header one.
  //
  {
    string b (make_image (
      "02",
      {{sif::datatype_partition, 4, sif::parttype_primary_system, "04"},
       {sif::datatype_signature}},
      2));

    sif_summary s (parse_sif_header (b));
    assert (s.version == "01");
    assert (s.architecture == "arm64");
    assert (s.descriptors_total == 4);
    assert (s.descriptors_used == 2);
    assert (s.has_primary_partition);
    assert (s.is_signed);
    assert (!s.is_encrypted);
  }

  // Encrypted primary partition; a non-primary partition is ignored.
  //
  {
    string b (make_image (
      "02",
      {{sif::datatype_partition, 4, 3, "05"},
       {sif::datatype_partition,
        sif::fstype_encrypted_squashfs,
        sif::parttype_primary_system,
        "02"}}));

    sif_summary s (parse_sif_header (b));
    assert (s.architecture == "amd64");
    assert (s.is_encrypted);
    assert (!s.is_signed);
  }

  // No partitions: the header decides, and may not know.
  //
  {
    sif_summary s (parse_sif_header (make_image ("02", {})));
    assert (s.architecture == "amd64");
    assert (!s.has_primary_partition);

    assert (parse_sif_header (make_image ("99", {})).architecture.empty ());
  }

  // Probe buffers may be longer than the table.
  //
  {
    string b (make_image ("02", {{sif::datatype_signature}}));
    b.append (4096, 'x');
    assert (parse_sif_header (b).is_signed);
  }
}

static void
test_invalid ()
{
  assert (header_error (string (100, '\0')) == scs::errc::invalid_sif);

  {
    string b (make_image ("02", {}));
    b[32] = 'X';
    assert (header_error (b) == scs::errc::invalid_sif);
  }

  // Table beyond the probe.
  //
  {
    string b (make_image ("02", {{sif::datatype_signature}}));
    b.resize (b.size () - 1);
    assert (header_error (b) == scs::errc::invalid_sif);
  }

  // Descriptor count large enough to wrap the table end back into the
  // buffer.
  //
  {
    string b (make_image ("02", {}));
    b.resize (200, '\0');
    put_le (b, 88, 2049638230412172402ULL, 8);
    put_le (b, 96, 0, 8);
    assert (header_error (b) == scs::errc::invalid_sif);
  }

  // Table offset past the end of the probe.
  //
  {
    string b (make_image ("02", {}));
    put_le (b, 96, 1ULL << 62, 8);
    assert (header_error (b) == scs::errc::invalid_sif);
  }

  // More free than total descriptors.
  //
  {
    string b (make_image ("02", {}));
    put_le (b, 80, 1, 8);
    assert (header_error (b) == scs::errc::invalid_sif);
  }
}

static void
test_config ()
{
  digest d (digest::of ("image"));

  sif_summary s;
  s.architecture = "amd64";
  s.is_signed = true;

  image_config c (make_image_config (s, d, "test"));
  assert (c.architecture == "amd64");
  assert (c.os == "linux");
  assert (c.rootfs == d);
  assert (c.description == "test");
  assert (c.is_signed && !c.is_encrypted);

  s.architecture.clear ();

  try
  {
    make_image_config (s, d);
    assert (false);
  }
  catch (const error& e)
  {
    assert (e.code () == scs::errc::invalid_image_config);
  }
}

int
main ()
{
  test_architecture ();
  test_header ();
  test_invalid ();
  test_config ();
}
