#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <optional>
#include <functional>

#include <boost/asio.hpp>

#include <scs/scs-log.hxx>
#include <scs/oci/oci-auth.hxx>
#include <scs/oci/oci-types.hxx>
#include <scs/oci/oci-digest.hxx>
#include <scs/auth/auth-credentials.hxx>
#include <scs/transfer/transfer-file.hxx>
#include <scs/transfer/transfer-types.hxx>
#include <scs/progress/progress-reporter.hxx>

namespace scs
{
  namespace asio = boost::asio;

  struct registry_traits
  {
    // Largest blob upload chunk.
    //
    std::uint64_t max_chunk_size = 5 * 1024 * 1024;

    // Redirects followed for GET and HEAD (blob storage is commonly behind
    // one).
    //
    std::uint8_t max_redirects = 10;
  };

  // Client for the subset of the OCI distribution API needed to move SIF
  // images: manifests and indices, blob existence, chunked blob upload and
  // ranged blob download.
  //
  // Requests are first sent without credentials. A 401 answer is retried
  // once with the registry credentials (or "none" if there are none),
  // negotiated against the WWW-Authenticate challenge.
  //
  // C is an HTTP client with basic_http_client's request() and stream()
  // interface.
  //
  template <typename C>
  class basic_oci_registry
  {
  public:
    using client_type   = C;
    using request_type  = typename client_type::request_type;
    using response_type = typename client_type::response_type;
    using body_callback = typename client_type::body_callback;
    using authenticator_type = basic_registry_authenticator<client_type>;

    // Re-create a request body for the authentication retry.
    //
    using rewind_function = std::function<std::string ()>;

    basic_oci_registry (client_type& c,
                        std::string base_url,
                        credentials_ptr credentials,
                        registry_traits traits = registry_traits (),
                        log_function log = nullptr)
      : client_ (c),
        base_url_ (std::move (base_url)),
        credentials_ (std::move (credentials)),
        traits_ (traits),
        auth_ (c, log),
        log_ (std::move (log)) {}

    // Send req, retrying once with negotiated credentials on 401. If sink is
    // given, a successful body is streamed to it.
    //
    // The request is updated in place, so afterwards it holds the
    // Authorization header actually used. A request with a body can only be
    // retried with a rewind function (unable_to_reset_body otherwise).
    //
    // Throws http_status_error for any other non-2xx status (code not_found
    // for 404) and with code unauthorized if the retry is rejected too.
    //
    asio::awaitable<response_type>
    do_request (request_type& req,
                const credentials_ptr& credentials,
                const namespace_access& access,
                const rewind_function& rewind = nullptr,
                const body_callback* sink = nullptr);

    // Fetch the manifest-like document name:reference as media_type.
    // Returns the digest the registry declared and the raw bytes.
    //
    // The Content-Type must match media_type exactly
    // (unexpected_content_type) and the digest header must be a valid
    // digest. If the reference is itself a digest, the bytes must match it.
    //
    asio::awaitable<std::pair<scs::digest, std::string>>
    download_manifest (const std::string& name,
                       const std::string& reference,
                       const std::string& media_type);

    asio::awaitable<std::pair<scs::digest, oci_index>>
    download_index (const std::string& name, const std::string& reference);

    asio::awaitable<std::pair<scs::digest, oci_manifest>>
    download_image_manifest (const std::string& name,
                             const std::string& reference);

    // Upload a manifest document. Its digest is computed locally and, with
    // no reference given, used as the reference.
    //
    asio::awaitable<scs::digest>
    upload_manifest (const std::string& name,
                     const std::string& bytes,
                     const std::string& media_type,
                     const std::string& reference = std::string ());

    // The image manifest for name:tag, going through the index if the tag
    // names one.
    //
    asio::awaitable<std::pair<scs::digest, oci_manifest>>
    image_manifest (const std::string& name,
                    const std::string& tag,
                    const std::string& arch);

    // Layer descriptor of the SIF image name:tag.
    //
    // The manifest must have a SIF config and exactly one layer; the config
    // is fetched and verified and, if arch is not empty, its architecture
    // must equal arch.
    //
    asio::awaitable<oci_descriptor>
    image_details (const std::string& name,
                   const std::string& tag,
                   const std::string& arch);

    // Fetch, verify and parse a SIF config blob.
    //
    asio::awaitable<scs::image_config>
    image_config (const std::string& name, const scs::digest&);

    // True if the registry reports the blob with exactly this digest.
    //
    asio::awaitable<bool>
    blob_exists (const std::string& name, const scs::digest&);

    // Upload size bytes from read as a blob in sequential chunks of at most
    // max_chunk_size. Returns the digest of the bytes read and their count.
    //
    asio::awaitable<std::pair<scs::digest, std::uint64_t>>
    upload_blob (const std::string& name,
                 std::uint64_t size,
                 read_function read);

    // Upload an in-memory blob unless the registry already has it.
    //
    asio::awaitable<oci_descriptor>
    push_blob (const std::string& name,
               const std::string& media_type,
               const std::string& bytes);

    // Fetch the rest of a part of a blob into the sink at its absolute
    // offsets. Returns the number of bytes written.
    //
    asio::awaitable<std::uint64_t>
    download_blob_part (const std::string& name,
                        const scs::digest&,
                        part_descriptor& part,
                        positional_sink& sink);

    // Fetch a whole blob into memory.
    //
    asio::awaitable<std::string>
    download_blob (const std::string& name, const scs::digest&);

    const std::string&
    base_url () const noexcept
    {
      return base_url_;
    }

    const credentials_ptr&
    credentials () const noexcept
    {
      return credentials_;
    }

  private:
    // Send once, following redirects for GET and HEAD.
    //
    asio::awaitable<response_type>
    send (request_type& req, const body_callback* sink);

    std::string
    url (const std::string& path) const;

  private:
    client_type& client_;
    std::string base_url_;
    credentials_ptr credentials_;
    registry_traits traits_;
    authenticator_type auth_;
    log_function log_;
  };
}

#include <scs/oci/oci-registry.txx>
