#pragma once

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <boost/json.hpp>

#include <scs/oci/oci-digest.hxx>

namespace scs
{
  namespace json = boost::json;

  namespace media_type
  {
    inline const std::string image_manifest (
      "application/vnd.oci.image.manifest.v1+json");

    inline const std::string image_index (
      "application/vnd.oci.image.index.v1+json");

    inline const std::string sif_config (
      "application/vnd.sylabs.sif.config.v1+json");

    inline const std::string sif_layer (
      "application/vnd.sylabs.sif.layer.v1.sif");
  }

  struct oci_platform
  {
    std::string architecture;
    std::string os;
    std::string variant;
  };

  struct oci_descriptor
  {
    std::string media_type;
    scs::digest digest;
    std::uint64_t size = 0;
    std::optional<oci_platform> platform;
    std::map<std::string, std::string> annotations;
  };

  struct oci_manifest
  {
    int schema_version = 2;
    std::string media_type;
    oci_descriptor config;
    std::vector<oci_descriptor> layers;
    std::map<std::string, std::string> annotations;
  };

  struct oci_index
  {
    int schema_version = 2;
    std::string media_type;
    std::vector<oci_descriptor> manifests;
  };

  // Contents of the SIF config blob.
  //
  struct image_config
  {
    std::string architecture;
    std::string os;
    scs::digest rootfs;
    std::string description;
    bool is_signed = false;
    bool is_encrypted = false;
  };

  // Parsers throw scs::error with malformed_value on bad JSON or a missing
  // required field, and invalid_digest on a malformed digest.
  //
  oci_descriptor
  parse_descriptor (const json::value&);

  oci_manifest
  parse_manifest (const std::string&);

  oci_index
  parse_index (const std::string&);

  // Also validates the config (non-empty architecture, valid rootfs
  // digest), throwing invalid_image_config.
  //
  image_config
  parse_image_config (const std::string&);

  json::value
  to_json (const oci_descriptor&);

  json::value
  to_json (const oci_manifest&);

  json::value
  to_json (const image_config&);

  // Compact JSON, the exact bytes that are digested and uploaded.
  //
  std::string
  serialize (const oci_manifest&);

  std::string
  serialize (const image_config&);

  // Select the image manifest for arch from an index.
  //
  // With an empty arch the index must hold exactly one image manifest
  // (otherwise arch_not_specified). Otherwise entries of other media types
  // are skipped and the first whose platform architecture matches exactly
  // is returned (otherwise no_matching_architecture).
  //
  scs::digest
  manifest_from_index (const oci_index&, const std::string& arch);

  // Manifest for a single SIF layer and its config blob.
  //
  oci_manifest
  make_sif_manifest (const oci_descriptor& config, const oci_descriptor& layer);
}
