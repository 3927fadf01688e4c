#include <scs/sif/sif-header.hxx>

#include <cstring>
#include <type_traits>

#include <scs/scs-error.hxx>

using namespace std;

namespace scs
{
  // Field offsets within the global header.
  //
  static const size_t magic_offset   = 32;
  static const size_t version_offset = 42;
  static const size_t arch_offset    = 45;
  static const size_t dfree_offset   = 80;
  static const size_t dtotal_offset  = 88;
  static const size_t descoff_offset = 96;

  // And within a descriptor.
  //
  static const size_t used_offset  = 4;
  static const size_t extra_offset = 201;

  template <typename T>
  static T
  read_le (const string& b, size_t o)
  {
    using U = make_unsigned_t<T>;

    U r (0);
    for (size_t i (0); i != sizeof (T); ++i)
      r |= static_cast<U> (static_cast<unsigned char> (b[o + i])) << (8 * i);

    return static_cast<T> (r);
  }

  // NUL-terminated string in a fixed-size field.
  //
  static string
  read_field (const string& b, size_t o, size_t n)
  {
    string r (b, o, n);
    r.resize (strnlen (r.c_str (), r.size ()));
    return r;
  }

  string
  sif_architecture (const string& c)
  {
    static const char* const names[] = {
      "386", "amd64", "arm", "arm64", "ppc64", "ppc64le",
      "mips", "mipsle", "mips64", "mips64le", "s390x", "riscv64"};

    if (c.size () != 2 ||
        c[0] < '0' || c[0] > '9' ||
        c[1] < '0' || c[1] > '9')
      return string ();

    size_t i ((c[0] - '0') * 10 + (c[1] - '0'));

    return i >= 1 && i <= sizeof (names) / sizeof (names[0])
      ? names[i - 1]
      : string ();
  }

  sif_summary
  parse_sif_header (const string& b)
  {
    if (b.size () < sif::header_size)
      throw error (errc::invalid_sif,
                   "invalid SIF: file too short (" + std::to_string (b.size ()) +
                   " bytes)");

    if (read_field (b, magic_offset, 10) != "SIF_MAGIC")
      throw error (errc::invalid_sif, "invalid SIF: bad magic");

    sif_summary r;
    r.version = read_field (b, version_offset, 3);
    r.architecture = sif_architecture (read_field (b, arch_offset, 3));

    int64_t total (read_le<int64_t> (b, dtotal_offset));
    int64_t dfree (read_le<int64_t> (b, dfree_offset));
    int64_t off (read_le<int64_t> (b, descoff_offset));

    if (total < 0 || dfree < 0 || dfree > total || off < 0)
      throw error (errc::invalid_sif, "invalid SIF: bad descriptor table");

    // Check the table fits in what we read without computing its end, which
    // a large count would overflow.
    //
    uint64_t o (static_cast<uint64_t> (off));
    uint64_t n (static_cast<uint64_t> (total));

    if (o > b.size () || n > (b.size () - o) / sif::descriptor_size)
      throw error (errc::invalid_sif,
                   "invalid SIF: descriptor table of " + std::to_string (n) +
                   " entries at offset " + std::to_string (o) +
                   " extends beyond the first " +
                   std::to_string (b.size ()) + " bytes");

    r.descriptors_total = static_cast<uint64_t> (total);

    for (int64_t i (0); i != total; ++i)
    {
      size_t d (static_cast<size_t> (off) + i * sif::descriptor_size);

      if (b[d + used_offset] == 0)
        continue;

      ++r.descriptors_used;

      int32_t t (read_le<int32_t> (b, d));

      if (t == sif::datatype_signature)
        r.is_signed = true;
      else if (t == sif::datatype_partition)
      {
        int32_t fs (read_le<int32_t> (b, d + extra_offset));
        int32_t pt (read_le<int32_t> (b, d + extra_offset + 4));

        if (pt != sif::parttype_primary_system || r.has_primary_partition)
          continue;

        r.has_primary_partition = true;
        r.is_encrypted = fs == sif::fstype_encrypted_squashfs;

        string a (sif_architecture (read_field (b, d + extra_offset + 8, 3)));
        if (!a.empty ())
          r.architecture = move (a);
      }
    }

    return r;
  }

  image_config
  make_image_config (const sif_summary& s,
                     const digest& rootfs,
                     const string& description)
  {
    if (s.architecture.empty ())
      throw error (errc::invalid_image_config,
                   "invalid image config: architecture not present");

    image_config r;
    r.architecture = s.architecture;
    r.os = "linux";
    r.rootfs = rootfs;
    r.description = description;
    r.is_signed = s.is_signed;
    r.is_encrypted = s.is_encrypted;
    return r;
  }
}
