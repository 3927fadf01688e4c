#pragma once

#include <string>
#include <vector>
#include <optional>

#include <boost/asio.hpp>

#include <scs/scs-log.hxx>
#include <scs/auth/auth-credentials.hxx>

namespace scs
{
  namespace asio = boost::asio;

  enum class metadata_kind
  {
    entity,
    collection,
    container,
    image
  };

  // Singular name, as used in log messages.
  //
  std::string
  to_string (metadata_kind);

  struct metadata_record
  {
    std::string id;

    // Whether the record existed before the call.
    //
    bool found = false;

    // Images only: whether the library already holds the image file.
    //
    bool uploaded = false;
  };

  // Decode a v1 API object response ({"data": {"id": ...}}). Throws
  // scs::error with malformed_value.
  //
  metadata_record
  parse_metadata_record (const std::string& body, bool found);

  // Body of the create request for a record at path under parent_id.
  //
  std::string
  metadata_create_body (metadata_kind,
                        const std::string& path,
                        const std::string& parent_id,
                        const std::string& description);

  // Decode a v1 tags response into the set tag names.
  //
  std::vector<std::string>
  parse_tag_names (const std::string& body);

  // Library metadata hierarchy: entity, collection, container, image.
  //
  class library_metadata
  {
  public:
    virtual
    ~library_metadata () = default;

    // Look up the record at path, creating it under parent_id if it does
    // not exist. Paths are entity, entity/collection,
    // entity/collection/container and entity/collection/container:hash.
    //
    virtual asio::awaitable<metadata_record>
    get_or_create (metadata_kind,
                   const std::string& path,
                   const std::string& parent_id,
                   const std::string& description) = 0;

    // Point each tag of the container at the image.
    //
    virtual asio::awaitable<void>
    set_tags (const std::string& container_id,
              const std::string& image_id,
              const std::vector<std::string>& tags) = 0;
  };

  // Metadata over the library's v1 JSON API.
  //
  template <typename C>
  class basic_library_metadata_client: public library_metadata
  {
  public:
    using client_type   = C;
    using request_type  = typename client_type::request_type;
    using response_type = typename client_type::response_type;

    basic_library_metadata_client (client_type& c,
                                   std::string base_url,
                                   credentials_ptr credentials,
                                   log_function log = nullptr)
      : client_ (c),
        base_url_ (std::move (base_url)),
        credentials_ (std::move (credentials)),
        log_ (std::move (log)) {}

    asio::awaitable<metadata_record>
    get_or_create (metadata_kind,
                   const std::string& path,
                   const std::string& parent_id,
                   const std::string& description) override;

    asio::awaitable<void>
    set_tags (const std::string& container_id,
              const std::string& image_id,
              const std::vector<std::string>& tags) override;

  private:
    // GET v1/<collection>/<path>. Returns the response body or nullopt on
    // 404.
    //
    asio::awaitable<std::optional<std::string>>
    get (const std::string& path);

    asio::awaitable<std::string>
    create (const std::string& path, const std::string& body);

    asio::awaitable<response_type>
    send (request_type&);

  private:
    client_type& client_;
    std::string base_url_;
    credentials_ptr credentials_;
    log_function log_;
  };
}

#include <scs/library/library-metadata.txx>
