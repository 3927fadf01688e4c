#pragma once

#include <string>
#include <vector>
#include <optional>

#include <boost/asio.hpp>

#include <scs/oci/oci.hxx>
#include <scs/sif/sif-header.hxx>
#include <scs/auth/auth-credentials.hxx>
#include <scs/library/library-types.hxx>
#include <scs/library/library-metadata.hxx>
#include <scs/transfer/transfer.hxx>
#include <scs/progress/progress-reporter.hxx>

namespace scs
{
  namespace asio = boost::asio;

  // Pull and push of SIF images to a library.
  //
  // Both directions try the OCI registry backing the library first and fall
  // back to the library's own (legacy) protocol when the library reports
  // that direct registry access is not available for the namespace.
  //
  // C is an HTTP client with basic_http_client's interface. It should not
  // follow redirects itself: the legacy pull counts and follows them, and
  // the registry client follows them for blob downloads.
  //
  template <typename C>
  class basic_library_client
  {
  public:
    using client_type   = C;
    using request_type  = typename client_type::request_type;
    using response_type = typename client_type::response_type;
    using body_callback   = typename client_type::body_callback;
    using header_callback = typename client_type::header_callback;
    using registry_type      = basic_oci_registry<client_type>;
    using authenticator_type = basic_registry_authenticator<client_type>;

    basic_library_client (client_type& c, client_config cfg)
      : client_ (c), config_ (std::move (cfg)), auth_ (c, config_.log) {}

    // Download name:tag (for architecture arch, if not empty) into dst.
    //
    // Over OCI the image is downloaded in parts and its digest verified by
    // reading dst back. Over the legacy protocol an initial ranged request
    // decides between a single stream (the server ignores Range) and a
    // multi-part download.
    //
    asio::awaitable<void>
    pull (const std::string& name,
          const std::string& tag,
          const std::string& arch,
          positional_store& dst,
          progress_reporter& progress);

    // Upload src as entity/collection/container name with the given tags.
    //
    // The metadata hierarchy down to the image record is resolved or
    // created first. The image config is derived from the SIF header; if
    // arch is not empty it must match the image's architecture. callback
    // may be null.
    //
    asio::awaitable<void>
    push (positional_source& src,
          const std::string& name,
          const std::vector<std::string>& tags,
          const std::string& description,
          library_metadata& metadata,
          upload_callback* callback = nullptr,
          const std::string& arch = std::string ());

    const client_config&
    config () const noexcept
    {
      return config_;
    }

  private:
    // Registry endpoint for name or nullopt if the library does not offer
    // direct access to it.
    //
    asio::awaitable<std::optional<registry_endpoint>>
    oci_endpoint (const std::string& name,
                  const std::vector<access_type>& access);

    asio::awaitable<void>
    oci_pull (const registry_endpoint&,
              const std::string& tag,
              const std::string& arch,
              positional_store& dst,
              progress_reporter& progress);

    asio::awaitable<void>
    legacy_pull (const std::string& name,
                 const std::string& tag,
                 const std::string& arch,
                 positional_sink& dst,
                 progress_reporter& progress);

    asio::awaitable<void>
    oci_push (const registry_endpoint&,
              positional_source& src,
              const digest& layer,
              const image_config& config,
              const std::vector<std::string>& tags,
              upload_callback& callback);

    asio::awaitable<void>
    legacy_push (positional_source& src,
                 const std::string& image_id,
                 upload_callback& callback);

    // Library bearer token, null when anonymous.
    //
    credentials_ptr
    library_credentials () const;

  private:
    client_type& client_;
    client_config config_;
    authenticator_type auth_;
  };
}

#include <scs/library/library-client.txx>
