#pragma once

#include <string>

#include <boost/asio.hpp>

#include <scs/scs-log.hxx>
#include <scs/auth/auth-challenge.hxx>
#include <scs/auth/auth-credentials.hxx>

namespace scs
{
  namespace asio = boost::asio;

  // Where and as whom to talk to the OCI registry backing a library.
  //
  struct registry_endpoint
  {
    std::string url;
    credentials_ptr credentials;

    // Artifact name to use for all registry calls. The library may remap a
    // short name (alpine) to its fully qualified form
    // (library/default/alpine).
    //
    std::string name;
  };

  // Obtains registry credentials, either up front from the library's
  // oci-redirect endpoint or in response to a registry challenge.
  //
  // C is an HTTP client with basic_http_client's request() interface.
  //
  template <typename C>
  class basic_registry_authenticator
  {
  public:
    using client_type   = C;
    using request_type  = typename client_type::request_type;
    using response_type = typename client_type::response_type;

    explicit
    basic_registry_authenticator (client_type& c, log_function l = nullptr)
      : client_ (c), log_ (std::move (l)) {}

    // Ask the library at library_url for direct registry access to name.
    //
    // Throws scs::error with oci_access_unsupported on any non-200 answer,
    // which callers take as the signal to use the legacy protocol.
    //
    asio::awaitable<registry_endpoint>
    authenticate (const std::string& library_url,
                  const credentials_ptr& library_credentials,
                  const std::string& name,
                  const namespace_access& access);

    // Credentials to retry a request with after the registry answered with
    // the given challenge.
    //
    // Basic credentials met with a Bearer challenge naming a realm are
    // exchanged for a token scoped to the requested access. Anything else
    // is used as supplied.
    //
    asio::awaitable<credentials_ptr>
    negotiate (const auth_challenge&,
               const credentials_ptr& supplied,
               const namespace_access& access);

  private:
    client_type& client_;
    log_function log_;
  };
}

#include <scs/oci/oci-auth.txx>
