#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>

#include <scs/scs-log.hxx>
#include <scs/http/http-client.hxx>
#include <scs/oci/oci-registry.hxx>
#include <scs/transfer/transfer-types.hxx>

namespace scs
{
  // Library client configuration.
  //
  struct client_config
  {
    // Primary service, e.g. https://library.sylabs.io.
    //
    std::string base_url = "https://library.sylabs.io";

    // Library bearer token. Empty means anonymous.
    //
    std::string auth_token;

    http_client_traits<> http;
    transfer_spec transfer;
    registry_traits registry;

    // Leading bytes of an image read to derive its config on push.
    //
    std::size_t header_probe_size = 64 * 1024;

    log_function log;
  };

  // Path of a container in the library hierarchy,
  // entity/collection/container.
  //
  struct library_path
  {
    std::string entity;
    std::string collection;
    std::string container;

    std::string
    collection_path () const
    {
      return entity + '/' + collection;
    }

    std::string
    container_path () const
    {
      return collection_path () + '/' + container;
    }
  };

  // Parse entity/collection/container, with an optional leading slash
  // and library: or library:// prefix. Throws scs::error with
  // malformed_value.
  //
  library_path
  parse_library_path (const std::string&);

  // Split "name:tag1,tag2" into the name and its tags. Tags default to
  // "latest".
  //
  std::pair<std::string, std::vector<std::string>>
  split_tags (const std::string&);

  // Registry namespace an artifact name belongs to: its first two
  // components (entity/collection), or the whole name if it has fewer.
  //
  std::string
  oci_namespace (const std::string& name);

  // Library image hash, "sha256.<hex>".
  //
  std::string
  image_hash (const digest&);
}
