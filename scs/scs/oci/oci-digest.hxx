#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <ostream>

#include <openssl/evp.h>

#include <scs/transfer/transfer-file.hxx>

namespace scs
{
  // Content digest in the algorithm:hex form, e.g. sha256:e3b0c4...
  //
  // Only sha256 and sha512 are recognized; the hex part must be lower case
  // and of the algorithm's length.
  //
  class digest
  {
  public:
    digest () = default;

    // Throws scs::error with invalid_digest.
    //
    digest (std::string algorithm, std::string hex);

    static digest
    parse (const std::string&);

    static bool
    valid (const std::string&) noexcept;

    // Digest of an in-memory buffer.
    //
    static digest
    of (const std::string& data, const std::string& algorithm = "sha256");

    const std::string&
    algorithm () const noexcept
    {
      return algorithm_;
    }

    const std::string&
    hex () const noexcept
    {
      return hex_;
    }

    std::string
    string () const
    {
      return empty () ? std::string () : algorithm_ + ':' + hex_;
    }

    bool
    empty () const noexcept
    {
      return hex_.empty ();
    }

    bool
    operator== (const digest& d) const noexcept
    {
      return algorithm_ == d.algorithm_ && hex_ == d.hex_;
    }

    bool
    operator!= (const digest& d) const noexcept
    {
      return !(*this == d);
    }

  private:
    std::string algorithm_;
    std::string hex_;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const digest& d)
  {
    return o << d.string ();
  }

  // Incremental digest computation over OpenSSL EVP.
  //
  class digester
  {
  public:
    explicit
    digester (const std::string& algorithm = "sha256");

    ~digester ();

    digester (const digester&) = delete;
    digester& operator= (const digester&) = delete;

    void
    update (const char* data, std::size_t size);

    // The digester may not be updated afterwards.
    //
    digest
    finish ();

    std::uint64_t
    size () const noexcept
    {
      return size_;
    }

  private:
    std::string algorithm_;
    EVP_MD_CTX* ctx_;
    std::uint64_t size_ = 0;
  };

  // Digest of everything readable from the source.
  //
  digest
  digest_source (positional_source&, const std::string& algorithm = "sha256");

  // Throw digest_mismatch_error unless actual equals expected.
  //
  void
  verify_digest (const digest& expected, const digest& actual);
}
