#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <stdexcept>

namespace scs
{
  // Error codes for transfer and registry operations.
  //
  enum class errc
  {
    invalid_size,
    invalid_part_size,
    http_status,
    not_found,
    unauthorized,
    invalid_auth_header,
    unknown_auth_type,
    unable_to_reset_body,
    oci_access_unsupported,
    arch_not_specified,
    no_matching_architecture,
    unexpected_architecture,
    unexpected_media_type,
    unexpected_layer_count,
    unexpected_content_type,
    digest_mismatch,
    invalid_digest,
    malformed_value,
    too_many_redirects,
    invalid_image_config,
    invalid_sif
  };

  std::string
  to_string (errc);

  inline std::ostream&
  operator<< (std::ostream& o, errc c)
  {
    return o << to_string (c);
  }

  // Base exception for everything this library reports. Transport failures
  // are left as boost::system::system_error.
  //
  class error: public std::runtime_error
  {
  public:
    error (errc c, const std::string& what)
      : std::runtime_error (what), code_ (c) {}

    errc
    code () const noexcept
    {
      return code_;
    }

  private:
    errc code_;
  };

  // Non-success HTTP status where a specific one was required.
  //
  class http_status_error: public error
  {
  public:
    http_status_error (std::uint16_t status, const std::string& body = {});

    http_status_error (errc c, std::uint16_t status, const std::string& what)
      : error (c, what), status_ (status) {}

    std::uint16_t
    status () const noexcept
    {
      return status_;
    }

  private:
    std::uint16_t status_;
  };

  class digest_mismatch_error: public error
  {
  public:
    digest_mismatch_error (const std::string& expected,
                           const std::string& actual);

    const std::string& expected () const noexcept {return expected_;}
    const std::string& actual () const noexcept {return actual_;}

  private:
    std::string expected_;
    std::string actual_;
  };

  class architecture_mismatch_error: public error
  {
  public:
    architecture_mismatch_error (const std::string& got,
                                 const std::string& want);

    const std::string& got () const noexcept {return got_;}
    const std::string& want () const noexcept {return want_;}

  private:
    std::string got_;
    std::string want_;
  };

  // Either the response Content-Type or a descriptor media type did not
  // match what was asked for.
  //
  class content_type_error: public error
  {
  public:
    content_type_error (errc c, const std::string& got, const std::string& want);

    const std::string& got () const noexcept {return got_;}
    const std::string& want () const noexcept {return want_;}

  private:
    std::string got_;
    std::string want_;
  };
}
