#include <scs/oci/oci-digest.hxx>

#include <stdexcept>

#include <scs/scs-error.hxx>

using namespace std;

namespace scs
{
  static const EVP_MD*
  digest_md (const string& a)
  {
    if (a == "sha256") return EVP_sha256 ();
    if (a == "sha512") return EVP_sha512 ();
    return nullptr;
  }

  static bool
  valid_hex (const string& a, const string& h) noexcept
  {
    size_t n (a == "sha256" ? 64 : a == "sha512" ? 128 : 0);

    if (n == 0 || h.size () != n)
      return false;

    for (char c: h)
    {
      if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
        return false;
    }

    return true;
  }

  digest::
  digest (std::string a, std::string h)
    : algorithm_ (move (a)), hex_ (move (h))
  {
    if (!valid_hex (algorithm_, hex_))
      throw error (errc::invalid_digest,
                   "invalid digest '" + algorithm_ + ':' + hex_ + "'");
  }

  digest digest::
  parse (const std::string& s)
  {
    size_t p (s.find (':'));

    if (p == std::string::npos)
      throw error (errc::invalid_digest, "invalid digest '" + s + "'");

    return digest (s.substr (0, p), s.substr (p + 1));
  }

  bool digest::
  valid (const std::string& s) noexcept
  {
    size_t p (s.find (':'));
    return p != std::string::npos &&
           valid_hex (s.substr (0, p), s.substr (p + 1));
  }

  digest digest::
  of (const std::string& d, const std::string& a)
  {
    digester h (a);
    h.update (d.data (), d.size ());
    return h.finish ();
  }

  digester::
  digester (const string& a)
    : algorithm_ (a), ctx_ (nullptr)
  {
    const EVP_MD* md (digest_md (a));

    if (md == nullptr)
      throw error (errc::invalid_digest,
                   "unsupported digest algorithm '" + a + "'");

    ctx_ = EVP_MD_CTX_new ();

    if (ctx_ == nullptr)
      throw runtime_error ("unable to allocate digest context");

    if (EVP_DigestInit_ex (ctx_, md, nullptr) != 1)
    {
      EVP_MD_CTX_free (ctx_);
      throw runtime_error ("unable to initialize " + a + " digest");
    }
  }

  digester::
  ~digester ()
  {
    EVP_MD_CTX_free (ctx_);
  }

  void digester::
  update (const char* d, size_t n)
  {
    if (EVP_DigestUpdate (ctx_, d, n) != 1)
      throw runtime_error ("unable to update " + algorithm_ + " digest");

    size_ += n;
  }

  digest digester::
  finish ()
  {
    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx_, h, &n) != 1)
      throw runtime_error ("unable to finalize " + algorithm_ + " digest");

    static const char xd[] = "0123456789abcdef";

    string r;
    r.reserve (n * 2);

    for (unsigned int i (0); i != n; ++i)
    {
      r += xd[h[i] >> 4];
      r += xd[h[i] & 0x0f];
    }

    return digest (algorithm_, move (r));
  }

  digest
  digest_source (positional_source& s, const string& a)
  {
    digester h (a);

    char buf[65536];
    uint64_t off (0);

    for (size_t n; (n = s.read_at (buf, sizeof (buf), off)) != 0; off += n)
      h.update (buf, n);

    return h.finish ();
  }

  void
  verify_digest (const digest& e, const digest& a)
  {
    if (e != a)
      throw digest_mismatch_error (e.string (), a.string ());
  }
}
